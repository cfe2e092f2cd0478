#pragma once
#include "sprig/diff.hpp"
#include "sprig/repo.hpp"

#include <optional>
#include <string>
#include <vector>

namespace sprig {

struct Status {
  std::optional<std::string> branch; // nullopt when HEAD is detached
  std::string head;                  // commit id, empty on an unborn branch
  bool merging = false;              // MERGE_HEAD is set

  std::vector<diff::FileChange> staged;   // HEAD vs index
  std::vector<diff::FileChange> unstaged; // index vs working (modified/deleted)
  std::vector<std::string> untracked;     // working - index
};

// Snapshot of where the repository stands. Does not write blobs.
Status compute_status(const Repository& repo);

} // namespace sprig
