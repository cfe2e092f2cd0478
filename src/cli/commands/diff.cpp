#include "sprig/diff.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_diff(int argc, char **argv) {
  bool cached = false;
  std::string rev;
  for (int i = 1; i < argc; ++i) {
    if (const std::string a = argv[i]; a == "--cached")
      cached = true;
    else
      rev = a;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());

    sprig::PathOidMap left, right;
    if (cached) {
      // HEAD (or rev) vs index
      left = rev.empty() ? repo.head_tree() : repo.tree_of(repo.resolve_oid(rev));
      right = repo.index_snapshot();
    } else if (!rev.empty()) {
      // rev vs working
      left = repo.tree_of(repo.resolve_oid(rev));
      right = repo.working_tree();
    } else {
      // index vs working
      left = repo.index_snapshot();
      right = repo.working_tree();
    }

    std::cout << sprig::diff::diff_trees(repo.objects(), left, right);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "diff: " << e.what() << "\n";
    return 1;
  }
}
