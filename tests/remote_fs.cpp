#include "sprig/errors.hpp"
#include "sprig/fs.hpp"
#include "sprig/graph.hpp"
#include "sprig/remote.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string commit_file(const sprig::Repository &repo, const std::string &name,
                               const std::string &content, const std::string &msg) {
  write_file(repo.root() / name, content);
  repo.add({name});
  return repo.commit(msg);
}

int main() {
  const auto tag = std::to_string(std::random_device{}());
  const fs::path remote = fs::temp_directory_path() / ("sprig_remote_" + tag);
  const fs::path local = fs::temp_directory_path() / ("sprig_local_" + tag);
  fs::create_directories(remote);
  fs::create_directories(local);

  const auto cleanup = [&] {
    std::error_code ec;
    fs::remove_all(remote, ec);
    fs::remove_all(local, ec);
  };
  const auto fail = [&](const std::string &msg) {
    std::cerr << msg << "\n";
    cleanup();
    return 1;
  };

  try {
    const sprig::Repository rrepo{remote};
    rrepo.init(sprig::Identity{"Remote", "r@example.com"});
    (void)commit_file(rrepo, "r.txt", "one\n", "c1");
    const std::string c2 = commit_file(rrepo, "r.txt", "one\ntwo\n", "c2");

    const sprig::Repository lrepo{local};
    lrepo.init(sprig::Identity{"Local", "l@example.com"});
    const sprig::remote::FilesystemTransport transport{remote};

    // Fetch copies the closure and records a remote-tracking ref
    const auto first = sprig::remote::fetch(lrepo, transport);
    if (first.branches.size() != 1 || first.branches.at("master") != c2 ||
        lrepo.refs().get("refs/remotes/origin/master").value != c2 ||
        first.objects_copied != 6) {
      return fail("first fetch wrong (" + std::to_string(first.objects_copied) + " objects)");
    }
    if (sprig::graph::ancestors(lrepo.objects(), {c2}).size() != 2) {
      return fail("fetched history incomplete");
    }

    // Fetch is idempotent
    const auto again = sprig::remote::fetch(lrepo, transport);
    if (again.objects_copied != 0 || lrepo.refs().get("refs/remotes/origin/master").value != c2) {
      return fail("second fetch should copy nothing");
    }

    // Start local master at the fetched tip and push a fast-forward
    lrepo.reset(lrepo.resolve_oid("origin/master"), true);
    if (lrepo.head_commit() != c2 || !fs::exists(local / "r.txt")) {
      return fail("local reset to the fetched tip failed");
    }
    const std::string c3 = commit_file(lrepo, "l.txt", "local\n", "c3");
    const auto pushed = sprig::remote::push(lrepo, transport, "refs/heads/master");
    if (pushed.old_tip != c2 || pushed.new_tip != c3 || pushed.objects_copied != 3 ||
        rrepo.refs().get("refs/heads/master").value != c3 || !rrepo.objects().exists(c3)) {
      return fail("fast-forward push wrong");
    }

    // Remote moves on; a diverged local push is rejected and changes nothing
    rrepo.reset(c3, true);
    const std::string r4 = commit_file(rrepo, "r.txt", "one\ntwo\nthree\n", "r4");
    const std::string c4 = commit_file(lrepo, "l.txt", "local\nmore\n", "c4");
    bool threw = false;
    try {
      (void)sprig::remote::push(lrepo, transport, "refs/heads/master");
    } catch (const sprig::NonFastForward &) {
      threw = true;
    }
    if (!threw || rrepo.refs().get("refs/heads/master").value != r4 ||
        rrepo.objects().exists(c4)) {
      return fail("non-fast-forward push should be rejected without side effects");
    }

    // Unknown local ref
    threw = false;
    try {
      (void)sprig::remote::push(lrepo, transport, "refs/heads/nope");
    } catch (const sprig::NoSuchLocalRef &) {
      threw = true;
    }
    if (!threw) {
      return fail("expected NoSuchLocalRef");
    }

    // Fetch, merge, push again
    (void)sprig::remote::fetch(lrepo, transport);
    const auto merged = lrepo.merge(lrepo.resolve_oid("origin/master"));
    if (merged.kind != sprig::MergeOutcome::Kind::Merged || !merged.conflicts.empty()) {
      return fail("merging the remote work should be clean");
    }
    const std::string m = lrepo.commit("merge origin/master");
    (void)sprig::remote::push(lrepo, transport, "refs/heads/master");
    if (rrepo.refs().get("refs/heads/master").value != m ||
        !sprig::graph::is_ancestor(rrepo.objects(), r4, m)) {
      return fail("push after merge wrong");
    }

    // Transport needs a repository
    threw = false;
    try {
      const sprig::remote::FilesystemTransport bad{local / "nowhere"};
    } catch (const sprig::NotARepository &) {
      threw = true;
    }
    if (!threw) {
      return fail("transport accepted a non-repository");
    }

    std::cout << "remote fs OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    cleanup();
    return 1;
  }
  cleanup();
  return 0;
}
