#include "sprig/repo.hpp"

#include "sprig/diff.hpp"
#include "sprig/errors.hpp"
#include "sprig/fs.hpp"
#include "sprig/graph.hpp"
#include "sprig/log.hpp"
#include "sprig/merge.hpp"
#include "sprig/time.hpp"
#include "sprig/util.hpp"
#include "sprig/worktree.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

namespace {

// Repo-relative, '/'-separated form of a user path; "" stands for the whole tree.
[[nodiscard]] auto normalize_relpath(std::string_view path) -> std::string {
  std::string norm = stdfs::path(std::string(path)).lexically_normal().generic_string();
  while (!norm.empty() && norm.back() == '/') {
    norm.pop_back();
  }
  if (norm == ".") {
    norm.clear();
  }
  if (norm == ".." || norm.starts_with("../") || norm.starts_with("/")) {
    throw sprig::Error("path is outside the repository: " + std::string(path));
  }
  const std::string repo_dir(sprig::consts::kRepoDir);
  if (norm == repo_dir || norm.starts_with(repo_dir + "/")) {
    throw sprig::Error("path is inside the repository directory: " + std::string(path));
  }
  return norm;
}

[[nodiscard]] auto under(std::string_view path, std::string_view dir) -> bool {
  if (dir.empty()) return true;
  return path == dir || (path.starts_with(dir) && path.size() > dir.size() &&
                         path[dir.size()] == '/');
}

} // namespace

namespace sprig {

Repository::Repository(stdfs::path root)
    : root_(std::move(root)), objects_(objects_dir()), refs_(repo_dir()) {}

Repository Repository::open(const stdfs::path &root) {
  Repository repo{root};
  if (!repo.is_initialized()) {
    throw NotARepository(root.string());
  }
  return repo;
}

Repository Repository::discover(const stdfs::path &start) {
  stdfs::path p = stdfs::absolute(start).lexically_normal();
  for (;;) {
    if (fs::exists(p / consts::kRepoDir)) {
      return Repository{p};
    }
    if (p == p.parent_path()) {
      break;
    }
    p = p.parent_path();
  }
  throw NotARepository(start.string());
}

auto Repository::is_initialized() const -> bool { return stdfs::is_directory(repo_dir()); }

void Repository::init(const Identity &identity) const {
  if (is_initialized()) {
    throw Error("A sprig repository already exists at: " + repo_dir().string());
  }

  std::error_code ec;
  for (const auto &dir : {objects_dir(), refs_dir() / "heads", refs_dir() / "tags"}) {
    stdfs::create_directories(dir, ec);
    if (ec) {
      throw std::runtime_error("create " + dir.string() + " failed: " + ec.message());
    }
  }

  refs_.update(consts::kHead, RefValue::to(heads_ref(consts::kDefaultBranch)), false);
  save_identity(repo_dir(), identity);
}

// Index

auto Repository::index_snapshot() const -> PathOidMap {
  Index idx{index_file()};
  idx.load();
  return idx.entries();
}

void Repository::add(const std::vector<std::string> &paths) const {
  edit_index([&](Index &idx) {
    for (const auto &raw : paths) {
      const std::string rel = normalize_relpath(raw);
      const stdfs::path abs = rel.empty() ? root_ : root_ / rel;

      if (stdfs::is_regular_file(abs)) {
        idx.stage(rel, objects_.put(consts::kTypeBlob, fs::read_file(abs)));
        continue;
      }

      // Directory (or vanished path): sync every index entry beneath it.
      PathOidMap present;
      if (stdfs::is_directory(abs)) {
        for (const auto &[sub, id] : worktree::flatten_directory(objects_, abs)) {
          present.emplace(rel.empty() ? sub : rel + "/" + sub, id);
        }
      }
      std::vector<std::string> gone;
      for (const auto &[path, _] : idx.entries()) {
        if (under(path, rel) && !present.contains(path)) gone.push_back(path);
      }
      if (present.empty() && gone.empty() && !stdfs::is_directory(abs)) {
        throw Error("pathspec '" + raw + "' did not match any files");
      }
      for (const auto &path : gone) idx.remove_path(path);
      for (const auto &[path, id] : present) idx.stage(path, id);
    }
  });
}

// Objects

auto Repository::hash_object(std::span<const std::uint8_t> bytes, std::string_view type) const
    -> std::string {
  return objects_.put(type, bytes);
}

auto Repository::read_commit(std::string_view commit_hex) const -> Commit {
  return sprig::read_commit(objects_, commit_hex);
}

auto Repository::write_tree() const -> std::string {
  return write_tree_from_map(objects_, index_snapshot());
}

void Repository::read_tree(std::string_view tree_hex, bool update_working) const {
  const PathOidMap snapshot = flatten_tree(objects_, tree_hex);
  edit_index([&](Index &idx) { idx.replace(snapshot); });
  if (update_working) {
    worktree::materialize(objects_, snapshot, root_);
  }
}

// Revisions

auto Repository::resolve_oid(std::string_view name) const -> std::string {
  const std::string n = name == "@" ? std::string(consts::kHead) : std::string(name);
  if (n.empty()) {
    throw UnknownRevision(n);
  }

  for (const auto &candidate : {n, std::string(consts::kRefsDir) + "/" + n, tags_ref(n),
                                heads_ref(n), std::string(consts::kRemotesPrefix) + n}) {
    // Top-level names other than HEAD/MERGE_HEAD are repository files, not refs.
    if (!candidate.starts_with(consts::kRefsDir) && candidate != consts::kHead &&
        candidate != consts::kMergeHead) {
      continue;
    }
    try {
      validate_ref_name(candidate);
    } catch (const InvalidRefName &) {
      continue;
    }
    if (const RefValue v = refs_.get(candidate); !v.empty()) {
      return v.value;
    }
  }

  if (looks_hex_prefix(n) && n.size() >= consts::kMinShortOid) {
    const auto matches = objects_.find_by_prefix(n);
    if (matches.size() == 1) {
      return matches.front();
    }
    if (matches.size() > 1) {
      throw AmbiguousOid(n);
    }
  }
  throw UnknownRevision(n);
}

auto Repository::head_commit() const -> std::string { return refs_.get(consts::kHead).value; }

auto Repository::current_branch() const -> std::optional<std::string> {
  const RefValue head = refs_.get(consts::kHead, false);
  if (!head.symbolic) {
    return std::nullopt;
  }
  if (head.value.starts_with(consts::kHeadsPrefix)) {
    return head.value.substr(consts::kHeadsPrefix.size());
  }
  return head.value;
}

auto Repository::is_branch(std::string_view name) const -> bool {
  const std::string ref = heads_ref(name);
  try {
    validate_ref_name(ref);
  } catch (const InvalidRefName &) {
    return false;
  }
  return !refs_.get(ref).empty();
}

auto Repository::branch_names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  for (const auto &[name, _] : refs_.list(consts::kHeadsPrefix)) {
    out.push_back(name.substr(consts::kHeadsPrefix.size()));
  }
  return out;
}

auto Repository::refs_by_oid() const -> std::map<std::string, std::vector<std::string>> {
  std::map<std::string, std::vector<std::string>> out;
  for (const auto &[name, value] : refs_.list()) {
    out[value.value].push_back(name);
  }
  return out;
}

// Snapshots

auto Repository::tree_of(std::string_view commit_hex) const -> PathOidMap {
  if (commit_hex.empty()) {
    return {};
  }
  return flatten_tree(objects_, read_commit(commit_hex).tree);
}

auto Repository::head_tree() const -> PathOidMap { return tree_of(head_commit()); }

auto Repository::working_tree(bool write_blobs) const -> PathOidMap {
  return worktree::flatten_directory(objects_, root_, worktree::ignore_nothing, write_blobs);
}

void Repository::require_clean_worktree(std::string_view operation) const {
  const auto idx = index_snapshot();
  if (idx != head_tree()) {
    throw Error(std::string(operation) + ": index has staged changes (commit them first)");
  }
  if (idx != working_tree(false)) {
    throw Error(std::string(operation) +
                ": working tree has unstaged changes or untracked files");
  }
}

// Porcelain

auto Repository::merge_in_progress() const -> bool {
  return !refs_.get(consts::kMergeHead, false).empty();
}

auto Repository::commit(std::string_view message) const -> std::string {
  Commit c{};
  c.tree = write_tree();

  if (const std::string head = head_commit(); !head.empty()) {
    c.parents.push_back(head);
  }

  const std::string merge_head = refs_.get(consts::kMergeHead, false).value;
  if (!merge_head.empty()) {
    for (const auto &change : diff::changed_files(index_snapshot(), working_tree(false))) {
      if (change.action != diff::Action::Added) {
        throw Error("cannot commit: merge in progress and " + change.path +
                    " has unstaged changes (add it first)");
      }
    }
    c.parents.push_back(merge_head);
  }

  c.author = timeutil::signature_now(commit_identity(repo_dir()));
  c.committer = c.author;
  c.message = std::string(message);
  if (!c.message.empty() && c.message.back() != consts::kLF) {
    c.message.push_back(consts::kLF);
  }

  const std::string commit_hex = write_commit(objects_, c);
  refs_.update(consts::kHead, RefValue::direct(commit_hex));
  if (!merge_head.empty()) {
    refs_.remove(consts::kMergeHead);
  }
  log::debug("commit " + commit_hex + " tree " + c.tree);
  return commit_hex;
}

void Repository::checkout(std::string_view name) const {
  if (merge_in_progress()) {
    throw Error("checkout: merge in progress (commit or abort it first)");
  }
  const std::string commit_hex = resolve_oid(name);
  const Commit target = read_commit(commit_hex);
  require_clean_worktree("checkout");

  read_tree(target.tree, true);

  if (is_branch(name)) {
    refs_.update(consts::kHead, RefValue::to(heads_ref(name)), false);
  } else {
    refs_.update(consts::kHead, RefValue::direct(commit_hex), false);
  }
}

void Repository::create_branch(std::string_view name, std::string_view start_oid) const {
  const std::string ref = heads_ref(name);
  validate_ref_name(ref);
  if (!refs_.get(ref).empty()) {
    throw Error("branch already exists: " + std::string(name));
  }
  (void)read_commit(start_oid);
  refs_.update(ref, RefValue::direct(std::string(start_oid)), false);
}

void Repository::create_tag(std::string_view name, std::string_view target_oid) const {
  const std::string ref = tags_ref(name);
  validate_ref_name(ref);
  if (!objects_.exists(target_oid)) {
    throw ObjectNotFound(std::string(target_oid));
  }
  refs_.update(ref, RefValue::direct(std::string(target_oid)), false);
}

void Repository::reset(std::string_view commit_hex, bool hard) const {
  const Commit target = read_commit(commit_hex);
  refs_.update(consts::kHead, RefValue::direct(std::string(commit_hex)));
  if (hard) {
    read_tree(target.tree, true);
    refs_.remove(consts::kMergeHead);
  }
}

auto Repository::merge(std::string_view other_hex) const -> MergeOutcome {
  if (merge_in_progress()) {
    throw Error("merge: a merge is already in progress (commit or abort it first)");
  }
  const std::string head = head_commit();
  if (head.empty()) {
    throw Error("merge: current branch has no commits");
  }
  const std::string other(other_hex);
  const Commit other_commit = read_commit(other);
  require_clean_worktree("merge");

  MergeOutcome outcome;
  if (graph::is_ancestor(objects_, other, head)) {
    outcome.base = other;
    outcome.kind = MergeOutcome::Kind::UpToDate;
    return outcome;
  }
  if (graph::is_ancestor(objects_, head, other)) {
    outcome.base = head;
    read_tree(other_commit.tree, true);
    refs_.update(consts::kHead, RefValue::direct(other));
    log::info("fast-forward " + head.substr(0, 7) + ".." + other.substr(0, 7));
    outcome.kind = MergeOutcome::Kind::FastForward;
    return outcome;
  }

  outcome.base = graph::merge_base(objects_, other, head);
  auto merged = merge::merge_trees(objects_, tree_of(outcome.base), tree_of(head),
                                   flatten_tree(objects_, other_commit.tree));
  edit_index([&](Index &idx) { idx.replace(merged.tree); });
  worktree::materialize(objects_, merged.tree, root_);
  refs_.update(consts::kMergeHead, RefValue::direct(other), false);

  for (const auto &path : merged.conflicts) {
    log::info("merge conflict in " + path);
  }
  outcome.kind = MergeOutcome::Kind::Merged;
  outcome.conflicts = std::move(merged.conflicts);
  return outcome;
}

void Repository::merge_abort() const {
  if (!merge_in_progress()) {
    throw Error("merge: no merge in progress");
  }
  const std::string head = head_commit();
  read_tree(read_commit(head).tree, true);
  refs_.remove(consts::kMergeHead);
}

} // namespace sprig
