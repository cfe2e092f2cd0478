#pragma once
#include <stdexcept>
#include <string>

namespace sprig {

// Base of every error raised by the core. Plain I/O failures stay std::runtime_error.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// ——— Object store integrity ———
class ObjectNotFound : public Error {
public:
  explicit ObjectNotFound(const std::string &hex) : Error("object not found: " + hex) {}
};

class TypeMismatch : public Error {
public:
  TypeMismatch(const std::string &hex, const std::string &expected, const std::string &actual)
      : Error("object " + hex + " is a " + actual + ", expected " + expected) {}
};

class CorruptObject : public Error {
public:
  using Error::Error;
};

// ——— Revision / ref resolution ———
class UnknownRevision : public Error {
public:
  explicit UnknownRevision(const std::string &name) : Error("unknown revision: " + name) {}
};

class AmbiguousOid : public Error {
public:
  explicit AmbiguousOid(const std::string &prefix) : Error("ambiguous object id: " + prefix) {}
};

class RefCycle : public Error {
public:
  explicit RefCycle(const std::string &name)
      : Error("symbolic ref chain does not terminate: " + name) {}
};

class InvalidRefName : public Error {
public:
  explicit InvalidRefName(const std::string &name) : Error("invalid ref name: '" + name + "'") {}
};

// ——— Graph / sync ———
class NoCommonAncestor : public Error {
public:
  NoCommonAncestor(const std::string &a, const std::string &b)
      : Error("no common ancestor between " + a + " and " + b) {}
};

class NonFastForward : public Error {
public:
  explicit NonFastForward(const std::string &refname)
      : Error("non-fast-forward update of " + refname + " rejected (fetch and merge first)") {}
};

class NoSuchLocalRef : public Error {
public:
  explicit NoSuchLocalRef(const std::string &refname) : Error("local ref not set: " + refname) {}
};

// ——— Repository ———
class NotARepository : public Error {
public:
  explicit NotARepository(const std::string &path)
      : Error("not a sprig repository (run `sprig init`): " + path) {}
};

} // namespace sprig
