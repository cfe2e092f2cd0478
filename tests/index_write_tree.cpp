#include "sprig/errors.hpp"
#include "sprig/index.hpp"
#include "sprig/objects.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static bool throws(auto &&fn) {
  try {
    fn();
  } catch (const sprig::Error &) {
    return true;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("sprig_index_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  try {
    const sprig::ObjectStore store{root / "objects"};
    const std::string b1 = store.put("blob", sprig::as_bytes("one\n"));
    const std::string b2 = store.put("blob", sprig::as_bytes("two\n"));
    const std::string b3 = store.put("blob", sprig::as_bytes("three\n"));

    // Index persistence
    {
      sprig::Index idx{root / "index"};
      idx.load();
      idx.stage("src/main.c", b1);
      idx.stage("README", b2);
      idx.stage("src/lib/util.c", b3);
      idx.save();
    }
    sprig::Index idx{root / "index"};
    idx.load();
    if (idx.entries().size() != 3 || !idx.contains("src/lib/util.c")) {
      std::cerr << "index did not round-trip\n";
      return 1;
    }
    if (throws([&] { idx.stage("../escape", b1); }) == false ||
        throws([&] { idx.stage("a//b", b1); }) == false ||
        throws([&] { idx.stage("ok", "xyz"); }) == false) {
      std::cerr << "index accepted a bad entry\n";
      return 1;
    }

    // write_tree -> flatten round trip
    const std::string root_tree = sprig::write_tree_from_map(store, idx.entries());
    if (sprig::flatten_tree(store, root_tree) != idx.entries()) {
      std::cerr << "flatten(write_tree(index)) != index\n";
      return 1;
    }

    // Nested layout: root holds README (blob) and src (tree)
    const auto top = sprig::read_tree(store, root_tree);
    if (top.size() != 2 || top[0].name != "README" || top[0].type != sprig::EntryType::Blob ||
        top[1].name != "src" || top[1].type != sprig::EntryType::Tree) {
      std::cerr << "unexpected root tree layout\n";
      return 1;
    }

    // Determinism: entry order does not matter
    const std::vector<sprig::TreeEntry> forward{{sprig::EntryType::Blob, b1, "a"},
                                                {sprig::EntryType::Blob, b2, "b"}};
    const std::vector<sprig::TreeEntry> backward{{sprig::EntryType::Blob, b2, "b"},
                                                 {sprig::EntryType::Blob, b1, "a"}};
    if (sprig::encode_tree(forward) != sprig::encode_tree(backward)) {
      std::cerr << "tree encoding depends on input order\n";
      return 1;
    }
    if (sprig::encode_tree(forward) != "blob " + b1 + " a\nblob " + b2 + " b\n") {
      std::cerr << "tree encoding format changed\n";
      return 1;
    }

    // Invalid entries
    const bool bad_names =
        throws([&] { (void)sprig::encode_tree({{sprig::EntryType::Blob, b1, "a/b"}}); }) &&
        throws([&] { (void)sprig::encode_tree({{sprig::EntryType::Blob, b1, ".."}}); }) &&
        throws([&] { (void)sprig::encode_tree({{sprig::EntryType::Blob, b1, ""}}); }) &&
        throws([&] {
          (void)sprig::encode_tree(
              {{sprig::EntryType::Blob, b1, "x"}, {sprig::EntryType::Blob, b2, "x"}});
        });
    if (!bad_names) {
      std::cerr << "encode_tree accepted an invalid entry\n";
      return 1;
    }

    // Commit codec
    sprig::Commit c{};
    c.tree = root_tree;
    c.parents = {b1, b2};
    c.author = "A U Thor <a@example.com> 1700000000 +0000";
    c.committer = c.author;
    c.message = "subject\n\nbody line\n";
    const std::string encoded = sprig::encode_commit(c);
    const auto decoded = sprig::decode_commit("x", sprig::as_bytes(encoded));
    if (decoded.tree != c.tree || decoded.parents != c.parents || decoded.author != c.author ||
        decoded.message != c.message) {
      std::cerr << "commit codec lost data\n";
      return 1;
    }
    c.message = "   \n";
    if (!throws([&] { (void)sprig::encode_commit(c); })) {
      std::cerr << "empty commit message accepted\n";
      return 1;
    }

    // An empty snapshot is an empty tree, and the empty id flattens to nothing
    const std::string empty_tree = sprig::write_tree_from_map(store, {});
    if (!sprig::read_tree(store, empty_tree).empty() || !sprig::flatten_tree(store, "").empty()) {
      std::cerr << "empty tree handling wrong\n";
      return 1;
    }

    std::cout << "index/write-tree OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
