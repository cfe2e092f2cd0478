#pragma once
#include "sprig/config.hpp"
#include "sprig/consts.hpp"
#include "sprig/index.hpp"
#include "sprig/object_store.hpp"
#include "sprig/objects.hpp"
#include "sprig/refs.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sprig {

struct MergeOutcome {
  enum class Kind : std::uint8_t { UpToDate, FastForward, Merged };

  Kind kind = Kind::UpToDate;
  std::string base;                   // merge base used
  std::vector<std::string> conflicts; // paths left with conflict markers
};

// Explicit handle on one repository: a working directory plus its .sprig directory.
// Every operation goes through a handle; there is no process-wide "current repository".
class Repository {
public:
  explicit Repository(std::filesystem::path root);

  // Open an existing repository rooted at `root`; throws NotARepository.
  static Repository open(const std::filesystem::path &root);

  // Walk up from `start` until a directory containing .sprig is found.
  static Repository discover(const std::filesystem::path &start);

  // Core paths
  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto repo_dir() const -> std::filesystem::path { return root_ / consts::kRepoDir; }
  [[nodiscard]] auto objects_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kObjectsDir;
  }
  [[nodiscard]] auto refs_dir() const -> std::filesystem::path {
    return repo_dir() / consts::kRefsDir;
  }
  [[nodiscard]] auto index_file() const -> std::filesystem::path {
    return repo_dir() / consts::kIndexFile;
  }

  [[nodiscard]] const ObjectStore &objects() const { return objects_; }
  [[nodiscard]] const RefStore &refs() const { return refs_; }

  // Initialize a new repo structure under root_.
  // Fails if .sprig already exists (to avoid clobber).
  void init(const Identity &identity = Identity{.name = "Your Name",
                                                .email = "you@example.com"}) const;

  // Convenience: does .sprig exist?
  [[nodiscard]] auto is_initialized() const -> bool;

  // ——— Index ———

  // Load the index, let `fn` edit it, then save it. Nothing is written if `fn` throws.
  template <class Fn> void edit_index(Fn &&fn) const {
    Index idx{index_file()};
    idx.load();
    fn(idx);
    idx.save();
  }

  [[nodiscard]] auto index_snapshot() const -> PathOidMap;

  // Stage files (directories recursively) given as repo-relative paths.
  // Paths that no longer exist are removed from the index.
  void add(const std::vector<std::string> &paths) const;

  // ——— Objects ———

  [[nodiscard]] auto hash_object(std::span<const std::uint8_t> bytes,
                                 std::string_view type = consts::kTypeBlob) const -> std::string;
  [[nodiscard]] auto read_commit(std::string_view commit_hex) const -> Commit;

  // Tree object built from the index.
  [[nodiscard]] auto write_tree() const -> std::string;

  // Replace the index with `tree_hex`, and the working directory too when asked.
  void read_tree(std::string_view tree_hex, bool update_working) const;

  // ——— Revisions ———

  // "@" (HEAD), a ref name (as is, or under refs/, refs/tags/, refs/heads/, refs/remotes/),
  // a full id, or a unique id prefix of at least 4 hex digits.
  [[nodiscard]] auto resolve_oid(std::string_view name) const -> std::string;

  // Commit HEAD resolves to, or empty on an unborn branch.
  [[nodiscard]] auto head_commit() const -> std::string;

  // "master" when HEAD is symbolic to refs/heads/master; nullopt when detached.
  [[nodiscard]] auto current_branch() const -> std::optional<std::string>;

  [[nodiscard]] auto is_branch(std::string_view name) const -> bool;
  [[nodiscard]] auto branch_names() const -> std::vector<std::string>;

  // Ref names pointing at each commit id (HEAD included), for log decorations.
  [[nodiscard]] auto refs_by_oid() const -> std::map<std::string, std::vector<std::string>>;

  // ——— Snapshots ———

  [[nodiscard]] auto tree_of(std::string_view commit_hex) const -> PathOidMap;
  [[nodiscard]] auto head_tree() const -> PathOidMap;
  [[nodiscard]] auto working_tree(bool write_blobs = true) const -> PathOidMap;

  // ——— Porcelain-level operations ———

  // Commit the index on top of HEAD (plus MERGE_HEAD, which is then cleared).
  [[nodiscard]] auto commit(std::string_view message) const -> std::string;

  // Branch name -> symbolic HEAD; anything else -> detached HEAD.
  void checkout(std::string_view name) const;

  void create_branch(std::string_view name, std::string_view start_oid) const;
  void create_tag(std::string_view name, std::string_view target_oid) const;

  // Move HEAD (and the branch it points to). `hard` also resets index and working tree.
  void reset(std::string_view commit_hex, bool hard = false) const;

  // Merge `other_hex` into HEAD: up to date, fast-forward, or a three-way merge that
  // leaves MERGE_HEAD behind for the following commit.
  [[nodiscard]] auto merge(std::string_view other_hex) const -> MergeOutcome;

  // Drop an in-progress merge: index and working tree back to HEAD, MERGE_HEAD removed.
  void merge_abort() const;

  [[nodiscard]] auto merge_in_progress() const -> bool;

private:
  void require_clean_worktree(std::string_view operation) const;

  std::filesystem::path root_;
  ObjectStore objects_;
  RefStore refs_;
};

} // namespace sprig
