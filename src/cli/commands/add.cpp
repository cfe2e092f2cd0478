#include "sprig/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig add <path> [<path> ...]\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(fs::current_path());

    // Paths are given relative to the current directory; the index wants repo-relative ones.
    std::vector<std::string> paths;
    for (int i = 1; i < argc; ++i) {
      const fs::path abs = fs::absolute(argv[i]).lexically_normal();
      std::string rel = abs.lexically_relative(repo.root()).generic_string();
      if (std::ranges::find(paths, rel) == paths.end()) {
        paths.push_back(std::move(rel));
      }
    }

    repo.add(paths);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "add: " << e.what() << "\n";
    return 1;
  }
}
