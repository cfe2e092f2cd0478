#pragma once
#include "sprig/objects.hpp"

#include <filesystem>
#include <functional>
#include <set>
#include <string>

namespace sprig::worktree {

// Decides whether a repo-relative path is left out of snapshots.
using IgnorePredicate = std::function<bool(const std::string&)>;

// Ignores nothing beyond the repository directory itself (always skipped).
bool ignore_nothing(const std::string& relpath);

// Enumerate regular files under root, excluding .sprig, as repo-relative paths
void enumerate_paths(const std::filesystem::path& root, const IgnorePredicate& ignore,
                     std::set<std::string>& out_paths);

// Build path->blob id map for the directory. With `write_blobs` the contents are
// stored as blob objects, otherwise ids are only computed.
auto flatten_directory(const ObjectStore& store, const std::filesystem::path& root,
                       const IgnorePredicate& ignore = ignore_nothing, bool write_blobs = true)
    -> PathOidMap;

// Make the directory match `snapshot`: delete non-ignored files not in it
// (pruning emptied directories), then write every listed blob.
void materialize(const ObjectStore& store, const PathOidMap& snapshot,
                 const std::filesystem::path& root,
                 const IgnorePredicate& ignore = ignore_nothing);

} // namespace sprig::worktree
