#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_write_tree(int /*argc*/, char ** /*argv*/) {
  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    std::cout << repo.write_tree() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "write-tree: " << e.what() << "\n";
    return 1;
  }
}
