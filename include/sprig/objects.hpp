#pragma once
#include "sprig/object_store.hpp"

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sprig {

// Flattened tree: full relative path ("dir/file") -> 40-hex blob id.
using PathOidMap = std::map<std::string, std::string>;

enum class EntryType : std::uint8_t { Blob, Tree };

std::string_view entry_type_name(EntryType type);

struct TreeEntry {
  EntryType   type;
  std::string id;    // 40-hex id of the referenced blob/tree
  std::string name;  // single path component (no '/')
};

struct Commit {
  std::string tree;                 // 40-hex tree id
  std::vector<std::string> parents; // zero, one or two parents (40-hex each)
  std::string author;               // "Name <email> <epoch> <tz>", may be empty
  std::string committer;
  std::string message;              // non-empty, may contain newlines
};

// Throws Error unless `name` is a usable tree entry name.
void validate_entry_name(std::string_view name);

// Throws Error unless `path` is relative, '/'-separated and free of '.'/'..'/empty parts.
void validate_path(std::string_view path);

// ——— Codec (pure) ———

// Serialize entries sorted by name, one "<type> <hex> <name>\n" line each.
std::string encode_tree(std::vector<TreeEntry> entries);
std::vector<TreeEntry> decode_tree(std::string_view hex, std::span<const std::uint8_t> payload);

std::string encode_commit(const Commit& commit);
Commit decode_commit(std::string_view hex, std::span<const std::uint8_t> payload);

// ——— Store-backed helpers ———

std::string write_tree(const ObjectStore& store, std::vector<TreeEntry> entries);
std::vector<TreeEntry> read_tree(const ObjectStore& store, std::string_view tree_hex);

std::string write_commit(const ObjectStore& store, const Commit& commit);
Commit read_commit(const ObjectStore& store, std::string_view commit_hex);

// Build nested tree objects bottom-up from a flat snapshot; returns the root tree id.
std::string write_tree_from_map(const ObjectStore& store, const PathOidMap& snapshot);

// Recursively expand a tree into path -> blob id. An empty `tree_hex` yields an empty map.
PathOidMap flatten_tree(const ObjectStore& store, std::string_view tree_hex);

} // namespace sprig
