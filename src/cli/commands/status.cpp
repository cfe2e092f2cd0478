#include "sprig/status.hpp"

#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>

using sprig::diff::Action;

int cmd_status(int /*argc*/, char ** /*argv*/) {
  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    const auto st = sprig::compute_status(repo);

    // Print current branch or detached state
    if (st.branch) {
      std::cout << "On branch " << *st.branch << "\n";
    } else {
      std::cout << "HEAD detached at " << st.head.substr(0, 7) << "\n";
    }
    if (st.head.empty()) {
      std::cout << "No commits yet\n";
    }
    if (st.merging) {
      std::cout << "You have unmerged paths (fix conflicts and run \"sprig commit\")\n";
    }
    std::cout << "\n";

    auto print_changes = [](const char *header, const std::vector<sprig::diff::FileChange> &xs) {
      std::cout << header << "\n";
      for (const auto &[path, action] : xs) {
        const char code = (action == Action::Added      ? 'A'
                           : action == Action::Modified ? 'M'
                                                        : 'D');
        std::cout << "  " << code << "  " << path << "\n";
      }
      if (xs.empty())
        std::cout << "  (none)\n";
      std::cout << "\n";
    };

    print_changes("Changes to be committed:", st.staged);
    print_changes("Changes not staged for commit:", st.unstaged);

    std::cout << "Untracked files:\n";
    if (st.untracked.empty())
      std::cout << "  (none)\n";
    else
      for (const auto &p : st.untracked)
        std::cout << "  " << p << "\n";
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}
