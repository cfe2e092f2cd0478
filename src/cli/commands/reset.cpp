#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_reset(int argc, char **argv) {
  bool hard = false;
  std::string rev;
  for (int i = 1; i < argc; ++i) {
    if (const std::string a = argv[i]; a == "--hard")
      hard = true;
    else
      rev = a;
  }
  if (rev.empty()) {
    std::cerr << "usage: sprig reset [--hard] <rev>\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const std::string oid = repo.resolve_oid(rev);
    repo.reset(oid, hard);
    std::cout << "HEAD is now at " << oid.substr(0, 7) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "reset: " << e.what() << "\n";
    return 1;
  }
}
