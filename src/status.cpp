#include "sprig/status.hpp"

#include <algorithm>

namespace sprig {

Status compute_status(const Repository &repo) {
  Status st;
  st.branch = repo.current_branch();
  st.head = repo.head_commit();
  st.merging = repo.merge_in_progress();

  const PathOidMap head_map = repo.head_tree();
  const PathOidMap index_map = repo.index_snapshot();
  const PathOidMap work_map = repo.working_tree(false);

  st.staged = diff::changed_files(head_map, index_map);

  // Files only in the working tree are untracked, not unstaged additions.
  for (auto &change : diff::changed_files(index_map, work_map)) {
    if (change.action == diff::Action::Added) {
      st.untracked.push_back(std::move(change.path));
    } else {
      st.unstaged.push_back(std::move(change));
    }
  }
  std::ranges::sort(st.untracked);
  return st;
}

} // namespace sprig
