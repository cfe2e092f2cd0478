#include "sprig/remote.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_fetch(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig fetch <path> [name]\n";
    return 2;
  }
  const std::string name = argc > 2 ? argv[2] : "origin";

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const sprig::remote::FilesystemTransport transport{argv[1]};
    const auto result = sprig::remote::fetch(repo, transport, name);
    for (const auto &[branch, tip] : result.branches) {
      std::cout << tip.substr(0, 7) << "  " << name << "/" << branch << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "fetch: " << e.what() << "\n";
    return 1;
  }
}
