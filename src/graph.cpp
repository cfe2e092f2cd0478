#include "sprig/graph.hpp"

#include "sprig/errors.hpp"
#include "sprig/objects.hpp"

namespace sprig::graph {

AncestorWalk::AncestorWalk(const ObjectStore &store, std::vector<std::string> start)
    : store_(store) {
  for (auto &id : start) {
    if (!id.empty()) {
      queue_.push_back(std::move(id));
    }
  }
}

void AncestorWalk::expand_pending() {
  if (!pending_) {
    return;
  }
  const auto commit = read_commit(store_, *pending_);
  pending_.reset();
  if (commit.parents.empty()) {
    return;
  }
  queue_.push_front(commit.parents.front());
  for (std::size_t i = 1; i < commit.parents.size(); ++i) {
    queue_.push_back(commit.parents[i]);
  }
}

std::optional<std::string> AncestorWalk::next() {
  expand_pending();
  while (!queue_.empty()) {
    std::string id = std::move(queue_.front());
    queue_.pop_front();
    if (!visited_.insert(id).second) {
      continue;
    }
    pending_ = id;
    return id;
  }
  return std::nullopt;
}

std::vector<std::string> ancestors(const ObjectStore &store, std::vector<std::string> start) {
  std::vector<std::string> out;
  AncestorWalk walk{store, std::move(start)};
  while (auto id = walk.next()) {
    out.push_back(std::move(*id));
  }
  return out;
}

bool is_ancestor(const ObjectStore &store, std::string_view candidate, std::string_view of) {
  if (candidate == of) return true;
  AncestorWalk walk{store, {std::string(of)}};
  while (const auto id = walk.next()) {
    if (*id == candidate) return true;
  }
  return false;
}

std::string merge_base(const ObjectStore &store, std::string_view a, std::string_view b) {
  if (a == b) {
    return std::string(a);
  }
  std::deque<std::string> queue_a{std::string(a)};
  std::deque<std::string> queue_b{std::string(b)};
  std::set<std::string> seen_a;
  std::set<std::string> seen_b;

  // Process one new commit from `queue`; returns it if the other side has seen it.
  const auto step = [&store](std::deque<std::string> &queue, std::set<std::string> &mine,
                             const std::set<std::string> &other) -> std::optional<std::string> {
    while (!queue.empty()) {
      std::string id = std::move(queue.front());
      queue.pop_front();
      if (!mine.insert(id).second) continue;
      if (other.contains(id)) return id;
      for (auto &p : read_commit(store, id).parents) {
        queue.push_back(std::move(p));
      }
      break;
    }
    return std::nullopt;
  };

  while (!queue_a.empty() || !queue_b.empty()) {
    if (auto hit = step(queue_a, seen_a, seen_b)) return *hit;
    if (auto hit = step(queue_b, seen_b, seen_a)) return *hit;
  }
  throw NoCommonAncestor(std::string(a), std::string(b));
}

void for_each_reachable_object(const ObjectStore &store, const std::vector<std::string> &commits,
                               const std::function<void(const std::string &)> &visit) {
  std::set<std::string> visited;

  const auto walk_tree = [&](const auto &self, const std::string &tree_hex) -> void {
    visited.insert(tree_hex);
    visit(tree_hex);
    for (const auto &e : read_tree(store, tree_hex)) {
      if (visited.contains(e.id)) continue;
      if (e.type == EntryType::Tree) {
        self(self, e.id);
      } else {
        visited.insert(e.id);
        visit(e.id);
      }
    }
  };

  AncestorWalk walk{store, commits};
  while (const auto id = walk.next()) {
    visit(*id);
    const auto commit = read_commit(store, *id);
    if (!visited.contains(commit.tree)) {
      walk_tree(walk_tree, commit.tree);
    }
  }
}

std::set<std::string> objects_reachable_from(const ObjectStore &store,
                                             const std::vector<std::string> &commits) {
  std::set<std::string> out;
  for_each_reachable_object(store, commits, [&out](const std::string &id) { out.insert(id); });
  return out;
}

} // namespace sprig::graph
