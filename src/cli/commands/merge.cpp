#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int cmd_merge(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: sprig merge <rev> | --abort\n";
    return 2;
  }
  const std::string giver = argv[1];

  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    if (giver == "--abort") {
      repo.merge_abort();
      std::cout << "Merge aborted.\n";
      return 0;
    }

    const auto outcome = repo.merge(repo.resolve_oid(giver));
    using Kind = sprig::MergeOutcome::Kind;
    switch (outcome.kind) {
    case Kind::UpToDate:
      std::cout << "Already up to date.\n";
      return 0;
    case Kind::FastForward:
      std::cout << "Fast-forward to " << repo.head_commit().substr(0, 7) << "\n";
      return 0;
    case Kind::Merged:
      break;
    }

    if (outcome.conflicts.empty()) {
      std::cout << "Merged cleanly (base " << outcome.base.substr(0, 7)
                << "); run \"sprig commit\" to record the merge.\n";
      return 0;
    }
    for (const auto &path : outcome.conflicts) {
      std::cout << "CONFLICT (content): Merge conflict in " << path << "\n";
    }
    std::cout << "Fix conflicts, add the files and run \"sprig commit\".\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "merge: " << e.what() << "\n";
    return 1;
  }
}
