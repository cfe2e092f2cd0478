#pragma once
#include "sprig/objects.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::diff {

enum class Action : std::uint8_t { Added, Modified, Deleted };

std::string_view action_name(Action action);

struct FileChange {
  std::string path;
  Action action;
};

// Paths whose blob differs between two flattened trees, in path order.
std::vector<FileChange> changed_files(const PathOidMap& from, const PathOidMap& to);

// Split raw text into lines, keeping each line's '\n' terminator.
// A final line without a terminator is kept as is.
std::vector<std::string> split_lines(std::string_view text);

enum class Op : char { Keep = '=', Delete = '-', Insert = '+' };

// Myers O(ND) shortest edit script turning `a` into `b`.
std::vector<Op> edit_script(const std::vector<std::string>& a, const std::vector<std::string>& b);

// Git's heuristic: a NUL byte within the first 8000 bytes.
bool is_binary(std::string_view content);

// Unified diff of two texts with 3 lines of context; empty when they are equal.
// Labels are used verbatim on the ---/+++ lines ("a/path", "/dev/null").
std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         std::string_view old_label, std::string_view new_label);

// "diff --git" section for one path; an empty id means the side is absent.
std::string diff_blobs(const ObjectStore& store, std::string_view path, std::string_view from_id,
                       std::string_view to_id);

// Concatenated diff_blobs output for every changed path.
std::string diff_trees(const ObjectStore& store, const PathOidMap& from, const PathOidMap& to);

} // namespace sprig::diff
