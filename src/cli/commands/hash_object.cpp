#include "sprig/consts.hpp"
#include "sprig/fs.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_hash_object(int argc, char **argv) {
  std::string type(sprig::consts::kTypeBlob);
  std::string file;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "-t" && i + 1 < argc) {
      type = argv[++i];
    } else {
      file = a;
    }
  }
  if (file.empty()) {
    std::cerr << "usage: sprig hash-object [-t <type>] <file>\n";
    return 2;
  }
  if (type != sprig::consts::kTypeBlob && type != sprig::consts::kTypeTree &&
      type != sprig::consts::kTypeCommit) {
    std::cerr << "hash-object: unknown object type: " << type << "\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    std::cout << repo.hash_object(sprig::fs::read_file(file), type) << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "hash-object: " << e.what() << "\n";
    return 1;
  }
}
