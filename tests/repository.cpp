#include "sprig/errors.hpp"
#include "sprig/fs.hpp"
#include "sprig/graph.hpp"
#include "sprig/repo.hpp"
#include "sprig/status.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string read_file(const fs::path &p) {
  auto bytes = sprig::fs::read_file(p);
  return {bytes.begin(), bytes.end()};
}

static bool has_change(const std::vector<sprig::diff::FileChange> &xs, const std::string &path,
                       sprig::diff::Action action) {
  return std::ranges::any_of(
      xs, [&](const auto &c) { return c.path == path && c.action == action; });
}

static int fail(const fs::path &root, const std::string &msg) {
  std::cerr << msg << "\n";
  std::error_code ec;
  fs::remove_all(root, ec);
  return 1;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("sprig_repository_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  try {
    const sprig::Repository repo{root};
    repo.init(sprig::Identity{"User", "u@example.com"});

    // Fresh repository: symbolic HEAD on an unborn master
    if (!repo.is_initialized() || repo.current_branch() != "master" ||
        !repo.head_commit().empty()) {
      return fail(root, "fresh repo state wrong");
    }
    const auto head_raw = repo.refs().get("HEAD", false);
    if (!head_raw.symbolic || head_raw.value != "refs/heads/master") {
      return fail(root, "HEAD should point at refs/heads/master");
    }
    bool threw = false;
    try {
      repo.init();
    } catch (const sprig::Error &) {
      threw = true;
    }
    if (!threw) {
      return fail(root, "second init should fail");
    }
    threw = false;
    try {
      (void)sprig::Repository::open(root / "elsewhere");
    } catch (const sprig::NotARepository &) {
      threw = true;
    }
    if (!threw) {
      return fail(root, "open outside a repository should fail");
    }

    // First commit
    write_file(root / "a.txt", "hello\n");
    write_file(root / "dir" / "b.txt", "b\n");
    repo.add({"."});
    if (repo.index_snapshot().size() != 2) {
      return fail(root, "add . should stage two files");
    }
    const std::string c1 = repo.commit("first");
    const auto info1 = repo.read_commit(c1);
    if (repo.head_commit() != c1 || repo.refs().get("refs/heads/master").value != c1 ||
        !info1.parents.empty() || !info1.author.starts_with("User <u@example.com> ") ||
        info1.message != "first\n") {
      return fail(root, "first commit wrong");
    }
    if (repo.write_tree() != info1.tree) {
      return fail(root, "write_tree should match the committed tree");
    }

    {
      const auto st = sprig::compute_status(repo);
      if (!st.staged.empty() || !st.unstaged.empty() || !st.untracked.empty() ||
          st.branch != "master" || st.merging) {
        return fail(root, "status should be clean after commit");
      }
    }

    // Unstaged, untracked, then staged
    write_file(root / "a.txt", "hello\nworld\n");
    write_file(root / "new.txt", "new\n");
    {
      const auto st = sprig::compute_status(repo);
      if (!has_change(st.unstaged, "a.txt", sprig::diff::Action::Modified) ||
          st.untracked != std::vector<std::string>{"new.txt"} || !st.staged.empty()) {
        return fail(root, "status before add wrong");
      }
    }
    repo.add({"a.txt", "new.txt"});
    {
      const auto st = sprig::compute_status(repo);
      if (!has_change(st.staged, "a.txt", sprig::diff::Action::Modified) ||
          !has_change(st.staged, "new.txt", sprig::diff::Action::Added) ||
          !st.unstaged.empty() || !st.untracked.empty()) {
        return fail(root, "status after add wrong");
      }
    }
    const std::string c2 = repo.commit("second\n");
    if (repo.read_commit(c2).parents != std::vector<std::string>{c1}) {
      return fail(root, "second commit should have the first as parent");
    }
    if (sprig::graph::ancestors(repo.objects(), {c2}) != std::vector<std::string>{c2, c1}) {
      return fail(root, "history order wrong");
    }

    // Discovery from a subdirectory
    if (sprig::Repository::discover(root / "dir").root() != fs::absolute(root).lexically_normal()) {
      return fail(root, "discover did not find the repository root");
    }

    // Revision names
    if (repo.resolve_oid("@") != c2 || repo.resolve_oid("master") != c2 ||
        repo.resolve_oid("heads/master") != c2 || repo.resolve_oid(c2.substr(0, 8)) != c2 ||
        repo.resolve_oid(c2) != c2) {
      return fail(root, "resolve_oid failed");
    }
    threw = false;
    try {
      (void)repo.resolve_oid("no-such-thing");
    } catch (const sprig::UnknownRevision &) {
      threw = true;
    }
    if (!threw) {
      return fail(root, "expected UnknownRevision");
    }

    // Short ids shared by two objects are ambiguous
    {
      std::map<std::string, int> by_prefix;
      std::string shared;
      for (int i = 0; i < 2000 && shared.empty(); ++i) {
        const std::string content = "blob " + std::to_string(i) + "\n";
        const std::string id = repo.hash_object(sprig::as_bytes(content));
        if (++by_prefix[id.substr(0, 4)] == 2) {
          shared = id.substr(0, 4);
        }
      }
      threw = false;
      try {
        (void)repo.resolve_oid(shared);
      } catch (const sprig::AmbiguousOid &) {
        threw = true;
      }
      if (shared.empty() || !threw) {
        return fail(root, "expected AmbiguousOid for a shared prefix");
      }
    }

    // Branches and tags
    repo.create_branch("topic", c1);
    repo.create_tag("v1", c1);
    if (!repo.is_branch("topic") || repo.is_branch("v1") ||
        repo.branch_names() != std::vector<std::string>{"master", "topic"} ||
        repo.resolve_oid("v1") != c1) {
      return fail(root, "branch/tag creation wrong");
    }
    threw = false;
    try {
      repo.create_branch("topic", c2);
    } catch (const sprig::Error &) {
      threw = true;
    }
    if (!threw) {
      return fail(root, "duplicate branch should fail");
    }
    {
      const auto by_oid = repo.refs_by_oid();
      const auto &names = by_oid.at(c1);
      if (std::ranges::find(names, "refs/tags/v1") == names.end() ||
          std::ranges::find(names, "refs/heads/topic") == names.end()) {
        return fail(root, "refs_by_oid missing names");
      }
    }

    // Checkout a branch: working tree and index follow
    repo.checkout("topic");
    if (repo.current_branch() != "topic" || read_file(root / "a.txt") != "hello\n" ||
        fs::exists(root / "new.txt") || !fs::exists(root / "dir" / "b.txt") ||
        repo.index_snapshot() != repo.tree_of(c1)) {
      return fail(root, "checkout topic did not materialize c1");
    }

    // Unstaged changes block checkout
    write_file(root / "a.txt", "dirty\n");
    threw = false;
    try {
      repo.checkout("master");
    } catch (const sprig::Error &) {
      threw = true;
    }
    if (!threw || repo.current_branch() != "topic") {
      return fail(root, "checkout over unstaged changes should fail");
    }
    write_file(root / "a.txt", "hello\n");

    // Detached checkout by id
    repo.checkout(c2);
    if (repo.current_branch().has_value() || repo.head_commit() != c2 ||
        !fs::exists(root / "new.txt")) {
      return fail(root, "detached checkout wrong");
    }
    repo.checkout("master");

    // Soft reset moves the branch only
    repo.reset(c1);
    if (repo.refs().get("refs/heads/master").value != c1 || !fs::exists(root / "new.txt")) {
      return fail(root, "soft reset wrong");
    }
    {
      const auto st = sprig::compute_status(repo);
      if (!has_change(st.staged, "new.txt", sprig::diff::Action::Added)) {
        return fail(root, "index should still hold the second commit after a soft reset");
      }
    }
    repo.reset(c2);

    // Hard reset also rewrites index and working tree
    repo.reset(c1, true);
    if (fs::exists(root / "new.txt") || repo.write_tree() != info1.tree) {
      return fail(root, "hard reset wrong");
    }

    // add on a removed directory unstages its files; unknown paths are errors
    fs::remove_all(root / "dir");
    repo.add({"dir"});
    if (repo.index_snapshot().contains("dir/b.txt")) {
      return fail(root, "removed file still staged");
    }
    threw = false;
    try {
      repo.add({"missing.txt"});
    } catch (const sprig::Error &) {
      threw = true;
    }
    if (!threw) {
      return fail(root, "adding a missing path should fail");
    }

    // The repository directory is never staged
    for (const std::string bad : {".sprig", ".sprig/HEAD", "dir/../.sprig/config"}) {
      threw = false;
      try {
        repo.add({bad});
      } catch (const sprig::Error &) {
        threw = true;
      }
      if (!threw) {
        return fail(root, "adding " + bad + " should fail");
      }
    }
    if (std::ranges::any_of(repo.index_snapshot(),
                            [](const auto &e) { return e.first.starts_with(".sprig"); })) {
      return fail(root, "repository files were staged");
    }

    // hash-object agrees with the store's addressing
    if (repo.hash_object(sprig::as_bytes("x")) != sprig::object_id_hex("blob", sprig::as_bytes("x"))) {
      return fail(root, "hash_object id mismatch");
    }

    std::cout << "repository OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
