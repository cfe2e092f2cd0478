#include "sprig/remote.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_push(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig push <path> [branch]\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    std::string branch;
    if (argc > 2) {
      branch = argv[2];
    } else if (const auto current = repo.current_branch()) {
      branch = *current;
    } else {
      std::cerr << "push: HEAD is detached; name the branch to push\n";
      return 2;
    }

    const sprig::remote::FilesystemTransport transport{argv[1]};
    const auto result = sprig::remote::push(repo, transport, sprig::heads_ref(branch));
    std::cout << (result.old_tip.empty() ? std::string("[new branch]")
                                         : result.old_tip.substr(0, 7) + ".." +
                                               result.new_tip.substr(0, 7))
              << "  " << branch << " -> " << branch << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "push: " << e.what() << "\n";
    return 1;
  }
}
