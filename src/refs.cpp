#include "sprig/refs.hpp"

#include "sprig/consts.hpp"
#include "sprig/errors.hpp"
#include "sprig/fs.hpp"
#include "sprig/util.hpp"

#include <cctype>
#include <string>
#include <string_view>

namespace sprig {

std::string heads_ref(std::string_view branch) {
  return std::string(consts::kHeadsPrefix) + std::string(branch);
}

std::string tags_ref(std::string_view tag) {
  return std::string(consts::kTagsPrefix) + std::string(tag);
}

void validate_ref_name(std::string_view name) {
  const std::string n(name);
  if (name.empty() || name.front() == '/' || name.back() == '/' || name.ends_with(".tmp")) {
    throw InvalidRefName(n);
  }
  for (const char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::iscntrl(uc) != 0 || std::isspace(uc) != 0 || c == '\\' || c == ':') {
      throw InvalidRefName(n);
    }
  }
  std::size_t pos = 0;
  while (pos <= name.size()) {
    const std::size_t slash = name.find('/', pos);
    const std::string_view part =
        name.substr(pos, slash == std::string_view::npos ? std::string_view::npos : slash - pos);
    if (part.empty() || part == "." || part == "..") {
      throw InvalidRefName(n);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    pos = slash + 1;
  }
}

std::filesystem::path RefStore::path_for(std::string_view name) const {
  validate_ref_name(name);
  return repo_dir_ / std::filesystem::path(std::string(name));
}

RefValue RefStore::read_one(std::string_view name) const {
  const auto p = path_for(name);
  if (!fs::exists(p) || std::filesystem::is_directory(p)) {
    return {};
  }
  std::string s = fs::read_text(p);
  strutil::rstrip_newlines(s);
  if (s.starts_with(consts::kRefPrefix)) {
    return RefValue::to(s.substr(consts::kRefPrefix.size()));
  }
  return RefValue::direct(std::move(s));
}

std::pair<std::string, RefValue> RefStore::resolve(std::string_view name, bool deref) const {
  std::string cur(name);
  for (int hop = 0; hop <= consts::kMaxSymrefDepth; ++hop) {
    RefValue value = read_one(cur);
    if (!deref || !value.symbolic) {
      return {std::move(cur), std::move(value)};
    }
    cur = value.value;
  }
  throw RefCycle(std::string(name));
}

RefValue RefStore::get(std::string_view name, bool deref) const {
  return resolve(name, deref).second;
}

void RefStore::update(std::string_view name, const RefValue &value, bool deref) const {
  if (value.empty()) {
    throw Error("refusing to write an empty value to ref " + std::string(name));
  }
  const std::string target = deref ? resolve(name, true).first : std::string(name);
  std::string text;
  if (value.symbolic) {
    validate_ref_name(value.value);
    text = std::string(consts::kRefPrefix) + value.value;
  } else {
    if (!looks_hex40(value.value)) {
      throw Error("ref " + target + ": not an object id: " + value.value);
    }
    text = value.value;
  }
  text.push_back(consts::kLF);
  fs::write_text_atomic(path_for(target), text);
}

void RefStore::remove(std::string_view name, bool deref) const {
  const std::string target = deref ? resolve(name, true).first : std::string(name);
  const auto p = path_for(target);
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec) {
    throw std::runtime_error("delete ref failed: " + target + ": " + ec.message());
  }
}

std::map<std::string, RefValue> RefStore::list(std::string_view prefix, bool deref) const {
  std::vector<std::string> names{std::string(consts::kHead), std::string(consts::kMergeHead)};
  const auto refs_root = repo_dir_ / consts::kRefsDir;
  std::error_code ec;
  if (std::filesystem::is_directory(refs_root, ec)) {
    for (auto it = std::filesystem::recursive_directory_iterator(refs_root);
         it != std::filesystem::recursive_directory_iterator(); ++it) {
      if (!it->is_regular_file() || it->path().extension() == ".tmp") {
        continue;
      }
      names.push_back(std::filesystem::relative(it->path(), repo_dir_).generic_string());
    }
  }

  std::map<std::string, RefValue> out;
  for (const auto &name : names) {
    if (!name.starts_with(prefix)) {
      continue;
    }
    RefValue value = get(name, deref);
    if (!value.empty()) {
      out.emplace(name, std::move(value));
    }
  }
  return out;
}

} // namespace sprig
