#include "sprig/objects.hpp"

#include "sprig/consts.hpp"
#include "sprig/errors.hpp"
#include "sprig/util.hpp"

#include <algorithm>
#include <utility>

namespace {
[[nodiscard]] auto split_first(std::string_view path)
    -> std::pair<std::string, std::string> {
  const std::size_t pos = path.find('/');
  if (pos == std::string_view::npos) {
    return {std::string(path), std::string{}};
  }
  return {std::string(path.substr(0, pos)), std::string(path.substr(pos + 1))};
}
} // namespace

namespace sprig {

std::string_view entry_type_name(EntryType type) {
  return type == EntryType::Tree ? consts::kTypeTree : consts::kTypeBlob;
}

void validate_entry_name(std::string_view name) {
  if (name.empty() || name == "." || name == ".." ||
      name.find_first_of(std::string_view("/\n\0", 3)) != std::string_view::npos) {
    throw Error("invalid tree entry name: '" + std::string(name) + "'");
  }
}

void validate_path(std::string_view path) {
  if (path.empty() || path.front() == '/') {
    throw Error("invalid path: '" + std::string(path) + "'");
  }
  std::string_view rest = path;
  for (;;) {
    const auto slash = rest.find('/');
    try {
      validate_entry_name(rest.substr(0, slash));
    } catch (const Error &) {
      throw Error("invalid path: '" + std::string(path) + "'");
    }
    if (slash == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(slash + 1);
  }
}

// Trees

std::string encode_tree(std::vector<TreeEntry> entries) {
  std::ranges::sort(entries,
                    [](const TreeEntry &a, const TreeEntry &b) { return a.name < b.name; });

  std::string data;
  for (std::size_t i = 0; i < entries.size(); ++i) {
    const auto &e = entries[i];
    validate_entry_name(e.name);
    if (i > 0 && entries[i - 1].name == e.name) {
      throw Error("duplicate tree entry: " + e.name);
    }
    if (!looks_hex40(e.id)) {
      throw Error("tree entry " + e.name + ": bad object id");
    }
    data.append(entry_type_name(e.type));
    data.push_back(consts::kSpace);
    data.append(e.id);
    data.push_back(consts::kSpace);
    data.append(e.name);
    data.push_back(consts::kLF);
  }
  return data;
}

std::vector<TreeEntry> decode_tree(std::string_view hex, std::span<const std::uint8_t> payload) {
  const std::string_view text = as_text(payload);
  std::vector<TreeEntry> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find(consts::kLF, pos);
    if (nl == std::string_view::npos) {
      throw CorruptObject("tree " + std::string(hex) + ": unterminated entry");
    }
    const std::string_view line = text.substr(pos, nl - pos);
    pos = nl + 1;

    const std::size_t sp1 = line.find(consts::kSpace);
    const std::size_t sp2 =
        sp1 == std::string_view::npos ? sp1 : line.find(consts::kSpace, sp1 + 1);
    if (sp2 == std::string_view::npos) {
      throw CorruptObject("tree " + std::string(hex) + ": malformed entry");
    }
    const std::string_view type = line.substr(0, sp1);
    TreeEntry e{};
    if (type == consts::kTypeBlob) {
      e.type = EntryType::Blob;
    } else if (type == consts::kTypeTree) {
      e.type = EntryType::Tree;
    } else {
      throw CorruptObject("tree " + std::string(hex) + ": unknown entry type " +
                          std::string(type));
    }
    e.id = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    e.name = std::string(line.substr(sp2 + 1));
    if (!looks_hex40(e.id)) {
      throw CorruptObject("tree " + std::string(hex) + ": bad object id");
    }
    try {
      validate_entry_name(e.name);
    } catch (const Error &err) {
      throw CorruptObject("tree " + std::string(hex) + ": " + err.what());
    }
    out.push_back(std::move(e));
  }
  return out;
}

// Commits

std::string encode_commit(const Commit &commit) {
  if (!looks_hex40(commit.tree)) {
    throw Error("commit: bad tree id");
  }
  if (strutil::trim(commit.message).empty()) {
    throw Error("commit: empty message");
  }

  std::string txt;
  txt += consts::kTreePrefix;
  txt += commit.tree;
  txt += consts::kLF;

  for (const auto &p : commit.parents) {
    if (!looks_hex40(p)) {
      throw Error("commit: bad parent id");
    }
    txt += consts::kParentPrefix;
    txt += p;
    txt += consts::kLF;
  }

  if (!commit.author.empty()) {
    txt += consts::kAuthorPrefix;
    txt += commit.author;
    txt += consts::kLF;
  }
  if (!commit.committer.empty()) {
    txt += consts::kCommitterPrefix;
    txt += commit.committer;
    txt += consts::kLF;
  }
  txt += consts::kLF;

  txt += commit.message;
  return txt;
}

Commit decode_commit(std::string_view hex, std::span<const std::uint8_t> payload) {
  const std::string text(as_text(payload));

  Commit info{};
  std::size_t pos = 0;

  for (;;) {
    const std::size_t nl = text.find('\n', pos);
    const std::string line =
        (nl == std::string::npos) ? text.substr(pos) : text.substr(pos, nl - pos);

    if (line.empty()) {
      if (nl != std::string::npos) {
        info.message = text.substr(nl + 1);
      }
      break;
    }

    if (line.starts_with(consts::kTreePrefix)) {
      info.tree = line.substr(consts::kTreePrefix.size());
    } else if (line.starts_with(consts::kParentPrefix)) {
      info.parents.push_back(line.substr(consts::kParentPrefix.size()));
    } else if (line.starts_with(consts::kAuthorPrefix)) {
      info.author = line.substr(consts::kAuthorPrefix.size());
    } else if (line.starts_with(consts::kCommitterPrefix)) {
      info.committer = line.substr(consts::kCommitterPrefix.size());
    }

    if (nl == std::string::npos) break;
    pos = nl + 1;
  }

  if (!looks_hex40(info.tree) ||
      !std::ranges::all_of(info.parents, [](const std::string &p) { return looks_hex40(p); })) {
    throw CorruptObject("commit " + std::string(hex) + ": malformed header");
  }
  return info;
}

// Store-backed helpers

std::string write_tree(const ObjectStore &store, std::vector<TreeEntry> entries) {
  return store.put(consts::kTypeTree, as_bytes(encode_tree(std::move(entries))));
}

std::vector<TreeEntry> read_tree(const ObjectStore &store, std::string_view tree_hex) {
  const auto obj = store.get(tree_hex, consts::kTypeTree);
  return decode_tree(tree_hex, obj.data);
}

std::string write_commit(const ObjectStore &store, const Commit &commit) {
  return store.put(consts::kTypeCommit, as_bytes(encode_commit(commit)));
}

Commit read_commit(const ObjectStore &store, std::string_view commit_hex) {
  const auto obj = store.get(commit_hex, consts::kTypeCommit);
  return decode_commit(commit_hex, obj.data);
}

std::string write_tree_from_map(const ObjectStore &store, const PathOidMap &snapshot) {
  const auto build = [&](const auto &self, const PathOidMap &group) -> std::string {
    std::map<std::string, PathOidMap> subdirs; // dirname -> child entries
    std::vector<TreeEntry> tree_entries;

    for (const auto &[path, id] : group) {
      const auto [first, rest] = split_first(path);
      if (rest.empty()) {
        tree_entries.push_back(TreeEntry{.type = EntryType::Blob, .id = id, .name = first});
      } else {
        subdirs[first].emplace(rest, id);
      }
    }

    for (const auto &[dirname, children] : subdirs) {
      tree_entries.push_back(
          TreeEntry{.type = EntryType::Tree, .id = self(self, children), .name = dirname});
    }
    return write_tree(store, std::move(tree_entries));
  };

  for (const auto &[path, _] : snapshot) {
    validate_path(path);
  }
  return build(build, snapshot);
}

static void flatten_tree_impl(const ObjectStore &store, std::string_view tree_hex,
                              const std::string &prefix, PathOidMap &out) {
  for (auto &e : read_tree(store, tree_hex)) {
    if (e.type == EntryType::Tree)
      flatten_tree_impl(store, e.id, prefix + e.name + "/", out);
    else
      out[prefix + e.name] = std::move(e.id);
  }
}

PathOidMap flatten_tree(const ObjectStore &store, std::string_view tree_hex) {
  PathOidMap m;
  if (!tree_hex.empty()) {
    flatten_tree_impl(store, tree_hex, "", m);
  }
  return m;
}

} // namespace sprig
