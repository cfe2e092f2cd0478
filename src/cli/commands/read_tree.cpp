#include "sprig/consts.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_read_tree(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig read-tree <tree|commit>\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    std::string oid = repo.resolve_oid(argv[1]);
    // a commit stands for its tree
    if (repo.objects().get(oid).type == sprig::consts::kTypeCommit) {
      oid = repo.read_commit(oid).tree;
    }
    repo.read_tree(oid, true);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "read-tree: " << e.what() << "\n";
    return 1;
  }
}
