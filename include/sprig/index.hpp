#pragma once
#include "sprig/objects.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace sprig {

// Staging area: a flat path -> blob id mapping persisted in .sprig/index
// as "<40-hex> <path>" lines sorted by path.
class Index {
public:
  explicit Index(std::filesystem::path index_file);

  // Parse the index file if it exists (empty index if missing)
  void load();

  // Overwrite the index file with current entries
  void save() const;

  // Add/replace an entry; `path` must be a normalized relative path
  void stage(std::string_view path, std::string_view blob_hex);

  // Remove a path from index (no error if absent)
  void remove_path(std::string_view path);

  // Replace all entries at once (checkout, read-tree, merge)
  void replace(PathOidMap snapshot);

  [[nodiscard]] bool contains(std::string_view path) const;
  const PathOidMap& entries() const { return entries_; }

private:
  std::filesystem::path index_file_;
  PathOidMap entries_;
};

} // namespace sprig
