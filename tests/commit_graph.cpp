#include "sprig/errors.hpp"
#include "sprig/graph.hpp"
#include "sprig/objects.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string make_commit(const sprig::ObjectStore &store, const std::string &tree,
                               std::vector<std::string> parents, const std::string &msg) {
  sprig::Commit c{};
  c.tree = tree;
  c.parents = std::move(parents);
  c.message = msg + "\n";
  return sprig::write_commit(store, c);
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("sprig_graph_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  try {
    const sprig::ObjectStore store{root / "objects"};
    const std::string b1 = store.put("blob", sprig::as_bytes("one\n"));
    const std::string b2 = store.put("blob", sprig::as_bytes("two\n"));
    const std::string t1 = sprig::write_tree_from_map(store, {{"a.txt", b1}});
    const std::string t2 = sprig::write_tree_from_map(store, {{"a.txt", b1}, {"dir/b.txt", b2}});

    //   c1 - c2 - c3 ------ m
    //          \          /
    //           c4 - c5 -
    const std::string c1 = make_commit(store, t1, {}, "c1");
    const std::string c2 = make_commit(store, t2, {c1}, "c2");
    const std::string c3 = make_commit(store, t2, {c2}, "c3");
    const std::string c4 = make_commit(store, t1, {c2}, "c4");
    const std::string c5 = make_commit(store, t1, {c4}, "c5");
    const std::string m = make_commit(store, t2, {c3, c5}, "merge");

    // First-parent line first, then the second parent's side
    const auto order = sprig::graph::ancestors(store, {m});
    const std::vector<std::string> expected{m, c3, c2, c1, c5, c4};
    if (order != expected) {
      std::cerr << "unexpected ancestor order\n";
      return 1;
    }

    // Ancestry is reflexive and one-way
    using sprig::graph::is_ancestor;
    if (!is_ancestor(store, c3, c3) || !is_ancestor(store, c1, c5) || is_ancestor(store, c5, c1) ||
        is_ancestor(store, c4, c3) || !is_ancestor(store, c4, m)) {
      std::cerr << "is_ancestor wrong\n";
      return 1;
    }

    using sprig::graph::merge_base;
    if (merge_base(store, c3, c5) != c2 || merge_base(store, c5, c3) != c2) {
      std::cerr << "merge_base(c3, c5) should be c2\n";
      return 1;
    }
    if (merge_base(store, c3, c1) != c1 || merge_base(store, m, c4) != c4 ||
        merge_base(store, c5, c5) != c5) {
      std::cerr << "merge_base with an ancestor should be the ancestor\n";
      return 1;
    }

    // Disjoint histories
    const std::string d1 = make_commit(store, t1, {}, "unrelated");
    bool threw = false;
    try {
      (void)merge_base(store, c3, d1);
    } catch (const sprig::NoCommonAncestor &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "expected NoCommonAncestor\n";
      return 1;
    }

    // Closure: 2 commits, 3 trees, 2 blobs
    const auto reach = sprig::graph::objects_reachable_from(store, {c2});
    if (reach.size() != 7 || !reach.contains(c1) || !reach.contains(b2) || reach.contains(c3)) {
      std::cerr << "reachable set has " << reach.size() << " objects\n";
      return 1;
    }

    // The visitor runs before each read: it can fill an empty store as the walk goes
    const sprig::ObjectStore copy{root / "copy"};
    std::size_t copied = 0;
    sprig::graph::for_each_reachable_object(copy, {m}, [&](const std::string &id) {
      if (!copy.exists(id)) {
        copy.put_raw(id, store.raw(id));
        ++copied;
      }
    });
    if (copied != 11 || sprig::graph::ancestors(copy, {m}).size() != 6) {
      std::cerr << "lazy copy transferred " << copied << " objects\n";
      return 1;
    }

    std::cout << "commit graph OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
