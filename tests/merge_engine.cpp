#include "sprig/merge.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static bool contains(const std::string &hay, const std::string &needle) {
  return hay.find(needle) != std::string::npos;
}

int main() {
  using sprig::merge::merge_text;

  // Same line edited differently: conflict with both sides present
  {
    const auto r = merge_text("A\nB\nC\n", "A\nX\nC\n", "A\nY\nC\n");
    const std::string expected = "A\n<<<<<<< HEAD\nX\n=======\nY\n>>>>>>> MERGE_HEAD\nC\n";
    if (!r.conflicted || r.content != expected) {
      std::cerr << "unexpected conflict output:\n" << r.content;
      return 1;
    }
  }

  // Disjoint edits combine
  {
    const auto r = merge_text("A\nB\nC\n", "X\nB\nC\n", "A\nB\nY\n");
    if (r.conflicted || r.content != "X\nB\nY\n") {
      std::cerr << "disjoint edits did not combine:\n" << r.content;
      return 1;
    }
  }

  // Convergence and one-sided changes
  {
    const auto same = merge_text("A\n", "B\n", "B\n");
    const auto ours = merge_text("A\n", "B\n", "A\n");
    const auto theirs = merge_text("A\n", "A\n", "C\n");
    if (same.conflicted || same.content != "B\n" || ours.content != "B\n" ||
        theirs.content != "C\n" || ours.conflicted || theirs.conflicted) {
      std::cerr << "trivial merges wrong\n";
      return 1;
    }
  }

  // Insertions at different places, plus the same insertion on both sides
  {
    const auto r = merge_text("1\n2\n3\n4\n", "0\n1\n2\n3\n4\n", "1\n2\n3\n4\n5\n");
    if (r.conflicted || r.content != "0\n1\n2\n3\n4\n5\n") {
      std::cerr << "insertions did not combine:\n" << r.content;
      return 1;
    }
    const auto both = merge_text("1\n2\n", "1\nnew\n2\n", "1\nnew\n2\n3\n");
    if (both.conflicted || both.content != "1\nnew\n2\n3\n") {
      std::cerr << "identical insertion merged wrong:\n" << both.content;
      return 1;
    }
  }

  // Custom labels and missing final newline
  {
    const auto r = merge_text("a", "b", "c", {.head = "ours", .other = "theirs"});
    if (!r.conflicted || r.content != "<<<<<<< ours\nb\n=======\nc\n>>>>>>> theirs\n") {
      std::cerr << "label/newline handling wrong:\n" << r.content;
      return 1;
    }
  }

  // Binary content that needs merging is a whole-file conflict
  {
    const auto r = merge_text(std::string("x\0", 2), std::string("y\0", 2), std::string("z\0", 2));
    if (!r.conflicted || !r.content.starts_with("<<<<<<< HEAD\n")) {
      std::cerr << "binary merge not flagged\n";
      return 1;
    }
  }

  // Tree level
  const fs::path root =
      fs::temp_directory_path() / ("sprig_merge_engine_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  try {
    const sprig::ObjectStore store{root / "objects"};
    const auto blob = [&store](const std::string &s) {
      return store.put("blob", sprig::as_bytes(s));
    };
    const std::string base_f = blob("A\nB\nC\n");

    const sprig::PathOidMap base{{"f", base_f}, {"del", blob("x\n")}, {"mod", blob("m\n")},
                                 {"both", blob("b\n")}};
    const sprig::PathOidMap head{{"f", blob("X\nB\nC\n")},
                                 {"del", blob("x\n")},
                                 {"both", blob("b2\n")},
                                 {"h_new", blob("h\n")}};
    const sprig::PathOidMap other{{"f", blob("A\nB\nY\n")},
                                  {"mod", blob("m2\n")},
                                  {"both", blob("b2\n")},
                                  {"o_new", blob("o\n")}};

    const auto merged = sprig::merge::merge_trees(store, base, head, other);

    // del: removed on the other side only -> removed
    // mod: deleted on head, modified on other -> conflict
    if (merged.tree.contains("del") || !merged.tree.contains("h_new") ||
        !merged.tree.contains("o_new") || merged.tree.at("both") != blob("b2\n")) {
      std::cerr << "tree merge picked the wrong sides\n";
      return 1;
    }
    if (merged.tree.at("f") != blob("X\nB\nY\n")) {
      std::cerr << "content merge not applied\n";
      return 1;
    }
    if (merged.conflicts != std::vector<std::string>{"mod"}) {
      std::cerr << "expected exactly one conflict on 'mod'\n";
      return 1;
    }
    const auto mod = store.get(merged.tree.at("mod"));
    const std::string text(sprig::as_text(mod.data));
    if (!contains(text, "<<<<<<< HEAD (deleted)\n") || !contains(text, "m2\n") ||
        !contains(text, ">>>>>>> MERGE_HEAD\n")) {
      std::cerr << "delete/modify conflict text wrong:\n" << text;
      return 1;
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);

  std::cout << "merge engine OK\n";
  return 0;
}
