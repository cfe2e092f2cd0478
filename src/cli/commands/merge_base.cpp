#include "sprig/graph.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_merge_base(int argc, char **argv) {
  if (argc < 3) {
    std::cerr << "usage: sprig merge-base <rev> <rev>\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    std::cout << sprig::graph::merge_base(repo.objects(), repo.resolve_oid(argv[1]),
                                          repo.resolve_oid(argv[2]))
              << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "merge-base: " << e.what() << "\n";
    return 1;
  }
}
