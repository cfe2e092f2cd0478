#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_checkout(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig checkout <branch|rev>\n";
    return 2;
  }
  const std::string target = argv[1];

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    repo.checkout(target);
    if (const auto branch = repo.current_branch()) {
      std::cout << "Switched to branch '" << *branch << "'\n";
    } else {
      std::cout << "HEAD is now at " << repo.head_commit().substr(0, 7) << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "checkout: " << e.what() << "\n";
    return 1;
  }
}
