#include "sprig/merge.hpp"

#include "sprig/consts.hpp"
#include "sprig/diff.hpp"

#include <set>

namespace sprig::merge {

namespace {

using Lines = std::vector<std::string>;

// For each line of `base`, the index of the matching line in `side`, or -1.
std::vector<long> align(const Lines &base, const Lines &side) {
  std::vector<long> match(base.size(), -1);
  std::size_t ib = 0;
  std::size_t is = 0;
  for (const auto op : diff::edit_script(base, side)) {
    switch (op) {
    case diff::Op::Keep:
      match[ib++] = static_cast<long>(is++);
      break;
    case diff::Op::Delete:
      ++ib;
      break;
    case diff::Op::Insert:
      ++is;
      break;
    }
  }
  return match;
}

void append_lines(std::string &out, const Lines &lines, std::size_t from, std::size_t to) {
  for (std::size_t i = from; i < to; ++i) {
    out += lines[i];
  }
}

void append_terminated(std::string &out, std::string_view text) {
  out += text;
  if (!text.empty() && text.back() != consts::kLF) {
    out.push_back(consts::kLF);
  }
}

void append_marker(std::string &out, std::string_view marker, std::string_view label) {
  out += marker;
  if (!label.empty()) {
    out.push_back(consts::kSpace);
    out += label;
  }
  out.push_back(consts::kLF);
}

// Both sides in full between one pair of markers.
std::string whole_file_conflict(std::string_view head, std::string_view other,
                                std::string_view head_label, std::string_view other_label) {
  std::string out;
  append_marker(out, consts::kMarkerOurs, head_label);
  append_terminated(out, head);
  append_marker(out, consts::kMarkerSep, {});
  append_terminated(out, other);
  append_marker(out, consts::kMarkerTheirs, other_label);
  return out;
}

bool same_range(const Lines &x, std::size_t x0, std::size_t x1, const Lines &y, std::size_t y0,
                std::size_t y1) {
  if (x1 - x0 != y1 - y0) {
    return false;
  }
  for (std::size_t i = 0; i < x1 - x0; ++i) {
    if (x[x0 + i] != y[y0 + i]) {
      return false;
    }
  }
  return true;
}

} // namespace

MergedText merge_text(std::string_view base, std::string_view head, std::string_view other,
                      const Labels &labels) {
  if (head == other || other == base) {
    return {std::string(head), false};
  }
  if (head == base) {
    return {std::string(other), false};
  }
  if (diff::is_binary(base) || diff::is_binary(head) || diff::is_binary(other)) {
    return {whole_file_conflict(head, other, labels.head, labels.other), true};
  }

  const Lines b = diff::split_lines(base);
  const Lines h = diff::split_lines(head);
  const Lines o = diff::split_lines(other);
  const auto match_h = align(b, h);
  const auto match_o = align(b, o);

  MergedText result;
  std::string &out = result.content;
  std::size_t ib = 0; // base cursor
  std::size_t ih = 0; // head cursor
  std::size_t io = 0; // other cursor

  for (;;) {
    // Stable run: base line kept, in place, by both sides.
    while (ib < b.size() && match_h[ib] == static_cast<long>(ih) &&
           match_o[ib] == static_cast<long>(io)) {
      out += b[ib];
      ++ib;
      ++ih;
      ++io;
    }
    if (ib == b.size() && ih == h.size() && io == o.size()) {
      break;
    }

    // Next base line both sides still share closes the unstable chunk.
    std::size_t next = ib;
    while (next < b.size() && (match_h[next] < 0 || match_o[next] < 0)) {
      ++next;
    }
    const std::size_t end_h = next < b.size() ? static_cast<std::size_t>(match_h[next]) : h.size();
    const std::size_t end_o = next < b.size() ? static_cast<std::size_t>(match_o[next]) : o.size();

    const bool head_changed = !same_range(h, ih, end_h, b, ib, next);
    const bool other_changed = !same_range(o, io, end_o, b, ib, next);
    if (!head_changed) {
      append_lines(out, o, io, end_o);
    } else if (!other_changed || same_range(h, ih, end_h, o, io, end_o)) {
      append_lines(out, h, ih, end_h);
    } else {
      result.conflicted = true;
      std::string ours;
      std::string theirs;
      append_lines(ours, h, ih, end_h);
      append_lines(theirs, o, io, end_o);
      append_marker(out, consts::kMarkerOurs, labels.head);
      append_terminated(out, ours);
      append_marker(out, consts::kMarkerSep, {});
      append_terminated(out, theirs);
      append_marker(out, consts::kMarkerTheirs, labels.other);
    }
    ib = next;
    ih = end_h;
    io = end_o;
  }
  return result;
}

TreeMerge merge_trees(const ObjectStore &store, const PathOidMap &base, const PathOidMap &head,
                      const PathOidMap &other, const Labels &labels) {
  std::set<std::string> all;
  for (const auto &[p, _] : base)  all.insert(p);
  for (const auto &[p, _] : head)  all.insert(p);
  for (const auto &[p, _] : other) all.insert(p);

  const auto get = [](const PathOidMap &m, const std::string &k) -> std::string {
    const auto it = m.find(k);
    return (it == m.end()) ? std::string{} : it->second;
  };
  const auto text_of = [&store](const std::string &id) -> std::string {
    if (id.empty()) return {};
    const auto obj = store.get(id, consts::kTypeBlob);
    return std::string(as_text(obj.data));
  };

  TreeMerge result;
  for (const auto &path : all) {
    const std::string ob = get(base, path);
    const std::string oh = get(head, path);
    const std::string oo = get(other, path);

    if (oh == oo) {
      if (!oh.empty()) result.tree[path] = oh; // agreement, including both deleted
      continue;
    }
    if (oh == ob) {
      if (!oo.empty()) result.tree[path] = oo; // only other changed
      continue;
    }
    if (oo == ob) {
      if (!oh.empty()) result.tree[path] = oh; // only head changed
      continue;
    }

    MergedText merged;
    if (oh.empty() || oo.empty()) {
      // Modified on one side, deleted on the other: keep the content, flag it.
      const std::string head_label = oh.empty() ? labels.head + " (deleted)" : labels.head;
      const std::string other_label = oo.empty() ? labels.other + " (deleted)" : labels.other;
      merged = {whole_file_conflict(text_of(oh), text_of(oo), head_label, other_label), true};
    } else {
      merged = merge_text(text_of(ob), text_of(oh), text_of(oo), labels);
    }
    result.tree[path] = store.put(consts::kTypeBlob, as_bytes(merged.content));
    if (merged.conflicted) {
      result.conflicts.push_back(path);
    }
  }
  return result;
}

} // namespace sprig::merge
