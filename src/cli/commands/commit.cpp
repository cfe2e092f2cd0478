#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_commit(int argc, char **argv) {
  // very small parser: sprig commit -m "msg"
  std::string message;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    }
  }
  if (message.empty()) {
    std::cerr << "usage: sprig commit -m <message>\n";
    return 2;
  }

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const std::string merge_head = repo.refs().get(sprig::consts::kMergeHead, false).value;
    if (!merge_head.empty()) {
      std::cout << "Finalizing merge with " << merge_head.substr(0, 7) << "\n";
    }
    const std::string oid = repo.commit(message);
    std::cout << oid << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "commit: " << e.what() << "\n";
    return 1;
  }
}
