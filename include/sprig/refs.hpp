#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>

namespace sprig {

// A ref either names a commit directly or points at another ref.
// An unset ref is represented as a direct ref with an empty value.
struct RefValue {
  bool symbolic = false;
  std::string value; // 40-hex id (direct) or ref name (symbolic)

  static RefValue direct(std::string hex) { return RefValue{false, std::move(hex)}; }
  static RefValue to(std::string refname) { return RefValue{true, std::move(refname)}; }

  [[nodiscard]] bool empty() const { return value.empty(); }
  bool operator==(const RefValue&) const = default;
};

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);
// "refs/tags/<tag>"
std::string tags_ref(std::string_view tag);

// Throws InvalidRefName unless `name` is a safe relative ref path.
void validate_ref_name(std::string_view name);

// Mutable name -> RefValue mapping stored as files under the repository directory:
// HEAD and MERGE_HEAD at the top, everything else beneath refs/.
class RefStore {
public:
  explicit RefStore(std::filesystem::path repo_dir) : repo_dir_(std::move(repo_dir)) {}

  // Follow symbolic refs (when `deref`) until a direct or unset ref is reached.
  // Returns the terminal ref name together with its value.
  [[nodiscard]] std::pair<std::string, RefValue> resolve(std::string_view name,
                                                         bool deref = true) const;

  // Shorthand for resolve(name, deref).second
  [[nodiscard]] RefValue get(std::string_view name, bool deref = true) const;

  // Write `value` to `name`, or to the end of its symbolic chain when `deref`.
  void update(std::string_view name, const RefValue& value, bool deref = true) const;

  // Delete the ref entry (the terminal one when `deref`). Missing refs are ignored.
  void remove(std::string_view name, bool deref = false) const;

  // HEAD, MERGE_HEAD and all refs under refs/ whose name starts with `prefix`.
  // Unset refs are skipped.
  [[nodiscard]] std::map<std::string, RefValue> list(std::string_view prefix = {},
                                                     bool deref = true) const;

private:
  [[nodiscard]] std::filesystem::path path_for(std::string_view name) const;
  [[nodiscard]] RefValue read_one(std::string_view name) const;

  std::filesystem::path repo_dir_;
};

} // namespace sprig
