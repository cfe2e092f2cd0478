#include "sprig/diff.hpp"

#include "sprig/consts.hpp"

#include <algorithm>
#include <set>
#include <sstream>

namespace sprig::diff {

std::string_view action_name(Action action) {
  switch (action) {
  case Action::Added:
    return "added";
  case Action::Modified:
    return "modified";
  case Action::Deleted:
    return "deleted";
  }
  return "?";
}

std::vector<FileChange> changed_files(const PathOidMap &from, const PathOidMap &to) {
  std::set<std::string> all;
  for (const auto &[p, _] : from)
    all.insert(p);
  for (const auto &[p, _] : to)
    all.insert(p);

  std::vector<FileChange> out;
  for (const auto &path : all) {
    const auto it_f = from.find(path);
    const auto it_t = to.find(path);
    const bool in_f = it_f != from.end();
    const bool in_t = it_t != to.end();
    if (in_f && in_t) {
      if (it_f->second != it_t->second)
        out.push_back({path, Action::Modified});
    } else if (in_t) {
      out.push_back({path, Action::Added});
    } else {
      out.push_back({path, Action::Deleted});
    }
  }
  return out;
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(pos));
      break;
    }
    out.emplace_back(text.substr(pos, nl - pos + 1));
    pos = nl + 1;
  }
  return out;
}

std::vector<Op> edit_script(const std::vector<std::string> &a, const std::vector<std::string> &b) {
  const int N = static_cast<int>(a.size());
  const int M = static_cast<int>(b.size());
  if (N == 0 || M == 0) {
    std::vector<Op> ops(a.size(), Op::Delete);
    ops.insert(ops.end(), b.size(), Op::Insert);
    return ops;
  }

  const int MAX = N + M;
  const int OFFSET = MAX;
  std::vector<int> v(2 * MAX + 2, 0);
  std::vector<std::vector<int>> trace;

  int found = -1;
  for (int d = 0; d <= MAX && found < 0; ++d) {
    trace.push_back(v); // snapshot before exploring this D layer
    for (int k = -d; k <= d; k += 2) {
      int x;
      if (k == -d || (k != d && v[OFFSET + k - 1] < v[OFFSET + k + 1])) {
        x = v[OFFSET + k + 1];     // down (insertion)
      } else {
        x = v[OFFSET + k - 1] + 1; // right (deletion)
      }
      int y = x - k;
      while (x < N && y < M && a[x] == b[y]) { ++x; ++y; }
      v[OFFSET + k] = x;
      if (x >= N && y >= M) {
        found = d;
        break;
      }
    }
  }

  // Backtrack through the snapshots from (N, M) to (0, 0).
  std::vector<Op> rev_ops;
  int x = N;
  int y = M;
  for (int d = found; d > 0; --d) {
    const auto &vv = trace[d];
    const int k = x - y;
    const bool down = (k == -d || (k != d && vv[OFFSET + k - 1] < vv[OFFSET + k + 1]));
    const int prev_k = down ? k + 1 : k - 1;
    const int prev_x = vv[OFFSET + prev_k];
    const int prev_y = prev_x - prev_k;
    const int mid_x = down ? prev_x : prev_x + 1;
    const int mid_y = mid_x - k;
    while (x > mid_x && y > mid_y) { rev_ops.push_back(Op::Keep); --x; --y; }
    rev_ops.push_back(down ? Op::Insert : Op::Delete);
    x = prev_x;
    y = prev_y;
  }
  while (x > 0 && y > 0) { rev_ops.push_back(Op::Keep); --x; --y; }

  return {rev_ops.rbegin(), rev_ops.rend()};
}

bool is_binary(std::string_view content) {
  const auto head = content.substr(0, std::min(content.size(), consts::kBinarySniffLen));
  return head.find('\0') != std::string_view::npos;
}

namespace {

struct Row {
  Op op;
  std::size_t a_pos; // index into a before this row
  std::size_t b_pos; // index into b before this row
};

void emit_line(std::ostringstream &out, char tag, const std::string &line) {
  out << tag << line;
  if (line.empty() || line.back() != '\n') {
    out << "\n\\ No newline at end of file\n";
  }
}

void emit_range(std::ostringstream &out, std::size_t start, std::size_t count) {
  // Zero-length ranges name the line before the hunk, as `diff -u` does.
  out << (count == 0 ? start : start + 1);
  if (count != 1) {
    out << ',' << count;
  }
}

} // namespace

std::string unified_diff(std::string_view old_text, std::string_view new_text,
                         std::string_view old_label, std::string_view new_label) {
  const auto a = split_lines(old_text);
  const auto b = split_lines(new_text);
  const auto ops = edit_script(a, b);

  std::vector<Row> rows;
  std::vector<std::size_t> changes;
  rows.reserve(ops.size());
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const Op op : ops) {
    if (op != Op::Keep)
      changes.push_back(rows.size());
    rows.push_back(Row{op, ia, ib});
    if (op != Op::Insert) ++ia;
    if (op != Op::Delete) ++ib;
  }
  if (changes.empty()) {
    return {};
  }

  std::ostringstream out;
  out << "--- " << old_label << "\n";
  out << "+++ " << new_label << "\n";

  const std::size_t ctx = consts::kDiffContext;
  std::size_t i = 0;
  while (i < changes.size()) {
    std::size_t last = changes[i];
    std::size_t j = i + 1;
    while (j < changes.size() && changes[j] - last <= (2 * ctx) + 1) {
      last = changes[j];
      ++j;
    }
    const std::size_t lo = changes[i] >= ctx ? changes[i] - ctx : 0;
    const std::size_t hi = std::min(rows.size(), last + ctx + 1);

    std::size_t a_count = 0;
    std::size_t b_count = 0;
    for (std::size_t r = lo; r < hi; ++r) {
      if (rows[r].op != Op::Insert) ++a_count;
      if (rows[r].op != Op::Delete) ++b_count;
    }
    out << "@@ -";
    emit_range(out, rows[lo].a_pos, a_count);
    out << " +";
    emit_range(out, rows[lo].b_pos, b_count);
    out << " @@\n";

    for (std::size_t r = lo; r < hi; ++r) {
      const Row &row = rows[r];
      switch (row.op) {
      case Op::Keep:
        emit_line(out, ' ', a[row.a_pos]);
        break;
      case Op::Delete:
        emit_line(out, '-', a[row.a_pos]);
        break;
      case Op::Insert:
        emit_line(out, '+', b[row.b_pos]);
        break;
      }
    }
    i = j;
  }
  return out.str();
}

std::string diff_blobs(const ObjectStore &store, std::string_view path, std::string_view from_id,
                       std::string_view to_id) {
  if (from_id == to_id) {
    return {};
  }
  const auto load = [&store](std::string_view id) -> std::string {
    if (id.empty()) {
      return {};
    }
    const auto obj = store.get(id, consts::kTypeBlob);
    return std::string(as_text(obj.data));
  };
  const std::string old_text = load(from_id);
  const std::string new_text = load(to_id);
  const std::string a_label = from_id.empty() ? "/dev/null" : "a/" + std::string(path);
  const std::string b_label = to_id.empty() ? "/dev/null" : "b/" + std::string(path);

  std::ostringstream out;
  out << "diff --git a/" << path << " b/" << path << "\n";
  if (from_id.empty()) {
    out << "new file\n";
  } else if (to_id.empty()) {
    out << "deleted file\n";
  }
  if (is_binary(old_text) || is_binary(new_text)) {
    out << "Binary files " << a_label << " and " << b_label << " differ\n";
  } else {
    out << unified_diff(old_text, new_text, a_label, b_label);
  }
  return out.str();
}

std::string diff_trees(const ObjectStore &store, const PathOidMap &from, const PathOidMap &to) {
  std::string out;
  const auto id_in = [](const PathOidMap &m, const std::string &path) -> std::string {
    const auto it = m.find(path);
    return it == m.end() ? std::string{} : it->second;
  };
  for (const auto &change : changed_files(from, to)) {
    out += diff_blobs(store, change.path, id_in(from, change.path), id_in(to, change.path));
  }
  return out;
}

} // namespace sprig::diff
