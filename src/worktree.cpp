#include "sprig/worktree.hpp"

#include "sprig/consts.hpp"
#include "sprig/fs.hpp"
#include "sprig/hash.hpp"

#include <filesystem>
#include <stdexcept>

namespace sfs = sprig::fs;

namespace sprig::worktree {

bool ignore_nothing(const std::string & /*relpath*/) { return false; }

void enumerate_paths(const std::filesystem::path &root, const IgnorePredicate &ignore,
                     std::set<std::string> &out_paths) {
  for (auto it = std::filesystem::recursive_directory_iterator(root);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    const auto &p = it->path();
    const std::string rel = std::filesystem::relative(p, root).generic_string();
    if (p.filename().string() == consts::kRepoDir || ignore(rel)) {
      if (it->is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file()) {
      continue;
    }
    out_paths.insert(rel);
  }
}

PathOidMap flatten_directory(const ObjectStore &store, const std::filesystem::path &root,
                             const IgnorePredicate &ignore, bool write_blobs) {
  PathOidMap m;
  std::set<std::string> paths;
  enumerate_paths(root, ignore, paths);
  for (const auto &rel : paths) {
    const auto bytes = sfs::read_file(root / rel);
    m[rel] = write_blobs ? store.put(consts::kTypeBlob, bytes)
                         : object_id_hex(consts::kTypeBlob, bytes);
  }
  return m;
}

void materialize(const ObjectStore &store, const PathOidMap &snapshot,
                 const std::filesystem::path &root, const IgnorePredicate &ignore) {
  // Remove extra files first (anything not present in snapshot but present in working)
  std::set<std::string> working_paths;
  enumerate_paths(root, ignore, working_paths);
  for (const auto &p : working_paths) {
    if (!snapshot.contains(p))
      sfs::remove_file_and_prune(root / p, root);
  }
  // Write/update listed files
  for (const auto &[path, hex] : snapshot) {
    const auto target = root / path;
    std::error_code ec;
    if (std::filesystem::is_directory(target, ec)) {
      std::filesystem::remove_all(target, ec);
      if (ec)
        throw std::runtime_error("cannot replace directory " + target.string() + ": " +
                                 ec.message());
    }
    const auto obj = store.get(hex, consts::kTypeBlob);
    sfs::write_file_atomic(target, obj.data);
  }
}

} // namespace sprig::worktree
