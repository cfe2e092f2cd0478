#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_tag(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig tag <name> [rev]\n";
    return 2;
  }
  const std::string name = argv[1];
  const std::string rev = argc > 2 ? argv[2] : "@";

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const std::string oid = repo.resolve_oid(rev);
    repo.create_tag(name, oid);
    std::cout << "Tag '" << name << "' created at " << oid.substr(0, 7) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "tag: " << e.what() << "\n";
    return 1;
  }
}
