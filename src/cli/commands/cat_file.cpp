#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_cat_file(int argc, char **argv) {
  bool type_only = false;
  std::string rev;
  for (int i = 1; i < argc; ++i) {
    if (const std::string a = argv[i]; a == "-t") {
      type_only = true;
    } else {
      rev = a;
    }
  }
  if (rev.empty()) {
    std::cerr << "usage: sprig cat-file [-t] <rev>\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const auto obj = repo.objects().get(repo.resolve_oid(rev));
    if (type_only) {
      std::cout << obj.type << "\n";
    } else {
      std::cout.write(reinterpret_cast<const char *>(obj.data.data()),
                      static_cast<std::streamsize>(obj.data.size()));
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "cat-file: " << e.what() << "\n";
    return 1;
  }
}
