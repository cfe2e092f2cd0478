#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_branch(int argc, char **argv) {
  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());

    if (argc < 2) {
      const auto current = repo.current_branch();
      for (const auto &name : repo.branch_names()) {
        std::cout << (current && *current == name ? "* " : "  ") << name << "\n";
      }
      return 0;
    }

    const std::string name = argv[1];
    const std::string start = repo.resolve_oid(argc > 2 ? argv[2] : "@");
    repo.create_branch(name, start);
    std::cout << "Branch '" << name << "' created at " << start.substr(0, 7) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "branch: " << e.what() << "\n";
    return 1;
  }
}
