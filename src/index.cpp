#include "sprig/index.hpp"

#include "sprig/consts.hpp"
#include "sprig/errors.hpp"
#include "sprig/fs.hpp"
#include "sprig/util.hpp"

#include <sstream>
#include <stdexcept>

namespace sprig {

Index::Index(std::filesystem::path index_file) : index_file_(std::move(index_file)) {}

void Index::load() {
  entries_.clear();
  if (!fs::exists(index_file_))
    return;

  std::istringstream is(fs::read_text(index_file_));
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(is, line)) {
    ++lineno;
    strutil::rstrip_newlines(line);
    if (line.empty())
      continue;

    // format: "<hex> <path>"
    const std::size_t sp = line.find(consts::kSpace);
    if (sp != consts::kOidHexLen || !looks_hex40(line.substr(0, sp)) || sp + 1 >= line.size()) {
      throw Error("index: malformed entry on line " + std::to_string(lineno));
    }
    std::string path = line.substr(sp + 1);
    validate_path(path);
    entries_[std::move(path)] = line.substr(0, sp);
  }
}

void Index::save() const {
  std::ostringstream os;
  for (const auto &[path, hex] : entries_) {
    os << hex << consts::kSpace << path << consts::kLF;
  }
  fs::write_text_atomic(index_file_, os.str());
}

void Index::stage(std::string_view path, std::string_view blob_hex) {
  validate_path(path);
  if (!looks_hex40(blob_hex)) {
    throw Error("index: not an object id: " + std::string(blob_hex));
  }
  entries_[std::string(path)] = std::string(blob_hex);
}

void Index::remove_path(std::string_view path) {
  entries_.erase(std::string(path));
}

void Index::replace(PathOidMap snapshot) {
  for (const auto &[path, hex] : snapshot) {
    validate_path(path);
    if (!looks_hex40(hex)) {
      throw Error("index: not an object id: " + hex);
    }
  }
  entries_ = std::move(snapshot);
}

bool Index::contains(std::string_view path) const {
  return entries_.contains(std::string(path));
}

} // namespace sprig
