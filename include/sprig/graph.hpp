#pragma once
#include "sprig/object_store.hpp"

#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sprig::graph {

/**
 * Lazy walk over commits and all their ancestors, each yielded exactly once.
 *
 * Order: a deque seeded with the starting ids. Each step pops the front and
 * yields it; the commit is parsed only on the following step, which pushes
 * its first parent to the front and any further parents to the back. The
 * result is first-parent depth-first order, with the second-parent side of
 * merges visited once the first-parent line is exhausted.
 *
 * Because parsing is deferred, a caller may make the yielded commit available
 * in the store (e.g. copy it from a remote) before asking for the next one.
 */
class AncestorWalk {
public:
  AncestorWalk(const ObjectStore& store, std::vector<std::string> start);

  // Next commit id, or nullopt when the walk is exhausted.
  std::optional<std::string> next();

private:
  void expand_pending();

  const ObjectStore& store_;
  std::deque<std::string> queue_;
  std::set<std::string> visited_;
  std::optional<std::string> pending_; // yielded but not yet expanded
};

// Convenience: the whole walk as a vector.
std::vector<std::string> ancestors(const ObjectStore& store, std::vector<std::string> start);

// True iff `candidate` equals `of` or is reachable from it through parent links.
[[nodiscard]] bool is_ancestor(const ObjectStore& store, std::string_view candidate,
                               std::string_view of);

/**
 * A common ancestor of `a` and `b`.
 * Breadth-first from both commits at once, one commit per side per round
 * (`a` first); the first commit already seen by the other side wins.
 * Throws NoCommonAncestor for disjoint histories.
 */
[[nodiscard]] std::string merge_base(const ObjectStore& store, std::string_view a,
                                     std::string_view b);

// Visit every commit, tree and blob reachable from `commits`, each once.
// `visit` runs before the object is read, so it may fetch the object first.
void for_each_reachable_object(const ObjectStore& store, const std::vector<std::string>& commits,
                               const std::function<void(const std::string&)>& visit);

std::set<std::string> objects_reachable_from(const ObjectStore& store,
                                             const std::vector<std::string>& commits);

} // namespace sprig::graph
