#include "sprig/config.hpp"
#include "sprig/consts.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  try {
    const std::filesystem::path root =
        argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::current_path();
    std::filesystem::create_directories(root);
    const sprig::Repository repo{root};
    // identity can be edited in .sprig/config or overridden from the environment
    repo.init(sprig::Identity{.name = "Your Name", .email = "you@example.com"});
    std::cout << "Initialized empty sprig repository in "
              << (std::filesystem::absolute(root) / sprig::consts::kRepoDir).string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
