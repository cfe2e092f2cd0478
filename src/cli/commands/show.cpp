#include "sprig/diff.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <vector>

// defined in log.cpp
void print_commit_header(const sprig::Repository &repo, const std::string &commit_hex,
                         const std::map<std::string, std::vector<std::string>> &decorations);

int cmd_show(int argc, char **argv) {
  const std::string rev = argc > 1 ? argv[1] : "@";
  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const std::string commit_hex = repo.resolve_oid(rev);
    const auto info = repo.read_commit(commit_hex);

    print_commit_header(repo, commit_hex, repo.refs_by_oid());

    const auto parent_tree =
        info.parents.empty() ? sprig::PathOidMap{} : repo.tree_of(info.parents.front());
    std::cout << sprig::diff::diff_trees(repo.objects(), parent_tree,
                                         sprig::flatten_tree(repo.objects(), info.tree));
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "show: " << e.what() << "\n";
    return 1;
  }
}
