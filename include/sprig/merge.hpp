#pragma once
#include "sprig/objects.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sprig::merge {

// Names printed after the conflict markers.
struct Labels {
  std::string head  = "HEAD";
  std::string other = "MERGE_HEAD";
};

struct MergedText {
  std::string content;
  bool conflicted = false;
};

/**
 * Three-way line merge of `head` and `other` against their common `base`.
 *
 * Both sides are aligned to the base with a line diff; base lines kept by
 * both sides split the files into stable and unstable chunks. An unstable
 * chunk changed on one side only takes that side, one changed identically on
 * both takes either, and anything else is written as
 *
 *   <<<<<<< HEAD
 *   head lines
 *   =======
 *   other lines
 *   >>>>>>> MERGE_HEAD
 *
 * Binary inputs that need merging become a single whole-file conflict.
 * Pure function: no store or filesystem access.
 */
MergedText merge_text(std::string_view base, std::string_view head, std::string_view other,
                      const Labels& labels = {});

struct TreeMerge {
  PathOidMap tree;                    // merged path -> blob id
  std::vector<std::string> conflicts; // paths whose blob carries conflict markers, sorted
};

// Merge three flattened trees. Merged blobs are written to `store`.
// Conflicts are reported in the result; only store errors throw.
TreeMerge merge_trees(const ObjectStore& store, const PathOidMap& base, const PathOidMap& head,
                      const PathOidMap& other, const Labels& labels = {});

} // namespace sprig::merge
