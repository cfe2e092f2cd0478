#include "sprig/consts.hpp"
#include "sprig/graph.hpp"
#include "sprig/repo.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

// "HEAD -> master, tag: v1, origin/master"
std::string decoration(const std::vector<std::string> &names, const std::string &current_ref) {
  std::string out;
  auto append = [&out](const std::string &s) {
    if (!out.empty())
      out += ", ";
    out += s;
  };
  for (const auto &name : names) {
    if (name == sprig::consts::kHead) {
      append(current_ref.empty() ? "HEAD"
                                 : "HEAD -> " + current_ref.substr(
                                                    sprig::consts::kHeadsPrefix.size()));
    }
  }
  for (const auto &name : names) {
    if (name == sprig::consts::kHead || name == current_ref)
      continue;
    if (name.starts_with(sprig::consts::kHeadsPrefix))
      append(name.substr(sprig::consts::kHeadsPrefix.size()));
    else if (name.starts_with(sprig::consts::kTagsPrefix))
      append("tag: " + name.substr(sprig::consts::kTagsPrefix.size()));
    else if (name.starts_with(sprig::consts::kRemotesPrefix))
      append(name.substr(sprig::consts::kRemotesPrefix.size()));
    else
      append(name);
  }
  return out;
}

} // namespace

void print_commit_header(const sprig::Repository &repo, const std::string &commit_hex,
                         const std::map<std::string, std::vector<std::string>> &decorations) {
  const auto info = repo.read_commit(commit_hex);
  const auto branch = repo.current_branch();
  const std::string current_ref = branch ? sprig::heads_ref(*branch) : std::string();

  std::cout << "commit " << commit_hex;
  if (const auto it = decorations.find(commit_hex); it != decorations.end()) {
    std::cout << " (" << decoration(it->second, current_ref) << ")";
  }
  std::cout << "\n";
  if (info.parents.size() > 1) {
    std::cout << "Merge:";
    for (const auto &p : info.parents)
      std::cout << " " << p.substr(0, 7);
    std::cout << "\n";
  }
  std::cout << "Author: " << info.author << "\n\n";

  std::istringstream msg(info.message);
  std::string line;
  while (std::getline(msg, line)) {
    std::cout << "    " << line << "\n";
  }
  std::cout << "\n";
}

int cmd_log(int argc, char **argv) {
  const std::string rev = argc > 1 ? argv[1] : "@";
  try {
    const auto repo = sprig::Repository::discover(std::filesystem::current_path());
    if (rev == "@" && repo.head_commit().empty()) {
      std::cerr << "log: current branch has no commits\n";
      return 1;
    }
    const auto decorations = repo.refs_by_oid();
    sprig::graph::AncestorWalk walk{repo.objects(), {repo.resolve_oid(rev)}};
    while (const auto commit_hex = walk.next()) {
      print_commit_header(repo, *commit_hex, decorations);
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "log: " << e.what() << "\n";
    return 1;
  }
}
