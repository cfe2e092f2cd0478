#pragma once
#include "sprig/object_store.hpp"
#include "sprig/refs.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::remote {

// What fetch/push need from the other side. Any implementation that copies
// objects verbatim and updates refs directly can stand in for another.
class Transport {
public:
  virtual ~Transport() = default;

  [[nodiscard]] virtual bool object_exists(std::string_view hex_oid) const = 0;

  // Copy one object from the remote into `local`.
  virtual void copy_object_in(std::string_view hex_oid, const ObjectStore& local) const = 0;

  // Copy one object from `local` to the remote.
  virtual void copy_object_out(std::string_view hex_oid, const ObjectStore& local) const = 0;

  // Dereferenced remote refs (name -> 40-hex) whose name starts with `prefix`.
  [[nodiscard]] virtual std::map<std::string, std::string>
  read_refs(std::string_view prefix) const = 0;

  virtual void write_ref(std::string_view name, std::string_view hex_oid) const = 0;
};

// Another repository on the same filesystem.
class FilesystemTransport final : public Transport {
public:
  // Throws NotARepository unless `remote_root` holds a .sprig directory.
  explicit FilesystemTransport(const std::filesystem::path& remote_root);

  [[nodiscard]] bool object_exists(std::string_view hex_oid) const override;
  void copy_object_in(std::string_view hex_oid, const ObjectStore& local) const override;
  void copy_object_out(std::string_view hex_oid, const ObjectStore& local) const override;
  [[nodiscard]] std::map<std::string, std::string>
  read_refs(std::string_view prefix) const override;
  void write_ref(std::string_view name, std::string_view hex_oid) const override;

private:
  ObjectStore objects_;
  RefStore refs_;
};

struct FetchResult {
  std::map<std::string, std::string> branches; // branch -> tip, as advertised
  std::size_t objects_copied = 0;
};

// Copy everything reachable from the remote's branches and record them as
// refs/remotes/<remote_name>/<branch>. Running it again copies nothing.
FetchResult fetch(const Repository& repo, const Transport& transport,
                  std::string_view remote_name = "origin");

struct PushResult {
  std::string old_tip; // remote value before the push (empty if it was unset)
  std::string new_tip;
  std::size_t objects_copied = 0;
};

// Fast-forward `refname` on the remote to its local value, sending the missing
// objects first. Throws NoSuchLocalRef or NonFastForward; the remote is left
// untouched in both cases.
PushResult push(const Repository& repo, const Transport& transport, std::string_view refname);

} // namespace sprig::remote
