#include "sprig/errors.hpp"
#include "sprig/refs.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static bool invalid(std::string_view name) {
  try {
    sprig::validate_ref_name(name);
  } catch (const sprig::InvalidRefName &) {
    return true;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("sprig_refs_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);
  try {
    const sprig::RefStore refs{root};
    const std::string c1(40, 'a');
    const std::string c2(40, 'b');

    // Unset refs read as empty
    if (!refs.get("HEAD").empty()) {
      std::cerr << "fresh HEAD should be unset\n";
      return 1;
    }

    // Symbolic HEAD on an unborn branch; writing through HEAD creates the branch
    refs.update("HEAD", sprig::RefValue::to(sprig::heads_ref("master")), false);
    refs.update("HEAD", sprig::RefValue::direct(c1));
    if (refs.get(sprig::heads_ref("master")).value != c1) {
      std::cerr << "deref update did not reach the branch\n";
      return 1;
    }
    const auto [terminal, value] = refs.resolve("HEAD");
    if (terminal != "refs/heads/master" || value.symbolic || value.value != c1) {
      std::cerr << "resolve returned " << terminal << " -> " << value.value << "\n";
      return 1;
    }
    const auto raw = refs.get("HEAD", false);
    if (!raw.symbolic || raw.value != "refs/heads/master") {
      std::cerr << "HEAD lost its symbolic value\n";
      return 1;
    }

    // Detach: write HEAD itself
    refs.update("HEAD", sprig::RefValue::direct(c2), false);
    if (refs.get("HEAD", false).symbolic || refs.get(sprig::heads_ref("master")).value != c1) {
      std::cerr << "detaching HEAD touched the branch\n";
      return 1;
    }

    // Listing
    refs.update(sprig::tags_ref("v1"), sprig::RefValue::direct(c1), false);
    const auto heads = refs.list("refs/heads/");
    if (heads.size() != 1 || !heads.contains("refs/heads/master")) {
      std::cerr << "list(refs/heads/) wrong\n";
      return 1;
    }
    const auto all = refs.list();
    if (!all.contains("HEAD") || !all.contains("refs/tags/v1") || all.contains("MERGE_HEAD")) {
      std::cerr << "list() wrong\n";
      return 1;
    }

    // Removal is idempotent
    refs.remove(sprig::tags_ref("v1"));
    refs.remove(sprig::tags_ref("v1"));
    if (!refs.get(sprig::tags_ref("v1")).empty()) {
      std::cerr << "tag still present after remove\n";
      return 1;
    }

    // Cycles are detected
    refs.update("refs/heads/x", sprig::RefValue::to("refs/heads/y"), false);
    refs.update("refs/heads/y", sprig::RefValue::to("refs/heads/x"), false);
    bool threw = false;
    try {
      (void)refs.get("refs/heads/x");
    } catch (const sprig::RefCycle &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "expected RefCycle\n";
      return 1;
    }

    // Name validation
    for (const char *bad : {"", "/abs", "refs/heads/", "refs/../HEAD", "refs//x", "a b",
                            "refs/heads/x.tmp", "a:b"}) {
      if (!invalid(bad)) {
        std::cerr << "accepted bad ref name '" << bad << "'\n";
        return 1;
      }
    }
    if (invalid("refs/heads/feature/one") || invalid("HEAD")) {
      std::cerr << "rejected a good ref name\n";
      return 1;
    }

    // Direct values must be object ids
    threw = false;
    try {
      refs.update("refs/heads/bad", sprig::RefValue::direct("not-a-hash"), false);
    } catch (const sprig::Error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "wrote a non-hex direct ref\n";
      return 1;
    }

    std::cout << "refs OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
