#include "sprig/object_store.hpp"

#include "sprig/consts.hpp"
#include "sprig/errors.hpp"
#include "sprig/fs.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sfs = sprig::fs;

namespace sprig {

namespace {

std::string lower(std::string_view s) {
  std::string out(s);
  std::ranges::transform(out, out.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool known_type(std::string_view type) {
  return type == consts::kTypeBlob || type == consts::kTypeTree || type == consts::kTypeCommit;
}

// Split "<type>\0<payload>" into its parts.
Object unframe(std::string_view hex_oid, std::vector<std::uint8_t> framed) {
  const auto it_nul = std::ranges::find(framed, static_cast<std::uint8_t>(consts::kNul));
  if (it_nul == framed.end()) {
    throw CorruptObject("object " + std::string(hex_oid) + ": missing type header");
  }
  std::string type(framed.begin(), it_nul);
  std::vector<std::uint8_t> data(it_nul + 1, framed.end());
  return Object{.type = std::move(type), .data = std::move(data)};
}

} // namespace

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  const std::filesystem::path dir = objects_dir_ / hex.substr(0, consts::kFanoutDirHexLen);
  return dir / hex.substr(consts::kFanoutDirHexLen);
}

std::filesystem::path ObjectStore::path_for_hex(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw ObjectNotFound(std::string(hex_oid));
  }
  return path_for_oid(id);
}

std::string ObjectStore::put(std::string_view type, std::span<const std::uint8_t> payload) const {
  if (!known_type(type)) {
    throw Error("unknown object type: " + std::string(type));
  }
  const auto framed = frame_object(type, payload);
  const oid id = sha1(framed);
  const auto path = path_for_oid(id);
  if (!sfs::exists(path)) {
    sfs::write_file_atomic(path, sfs::z_compress(framed));
  }
  return to_hex(id);
}

Object ObjectStore::get(std::string_view hex_oid,
                        std::optional<std::string_view> expected_type) const {
  const auto path = path_for_hex(hex_oid);
  if (!sfs::exists(path)) {
    throw ObjectNotFound(std::string(hex_oid));
  }
  Object obj = unframe(hex_oid, sfs::z_decompress(sfs::read_file(path)));
  if (expected_type && obj.type != *expected_type) {
    throw TypeMismatch(std::string(hex_oid), std::string(*expected_type), obj.type);
  }
  return obj;
}

bool ObjectStore::exists(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    return false;
  }
  return sfs::exists(path_for_oid(id));
}

std::vector<std::string> ObjectStore::find_by_prefix(std::string_view hex_prefix) const {
  std::vector<std::string> out;
  const std::string prefix = lower(hex_prefix);
  if (prefix.size() < consts::kFanoutDirHexLen || prefix.size() > consts::kOidHexLen ||
      !std::ranges::all_of(prefix, [](unsigned char c) { return std::isxdigit(c) != 0; })) {
    return out;
  }
  const auto fan = objects_dir_ / prefix.substr(0, consts::kFanoutDirHexLen);
  std::error_code ec;
  if (!std::filesystem::is_directory(fan, ec)) {
    return out;
  }
  const std::string rest = prefix.substr(consts::kFanoutDirHexLen);
  for (const auto &entry : std::filesystem::directory_iterator(fan)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    const std::string name = entry.path().filename().string();
    if (name.size() != consts::kOidHexLen - consts::kFanoutDirHexLen || !name.starts_with(rest)) {
      continue; // also skips stray *.tmp files
    }
    out.push_back(prefix.substr(0, consts::kFanoutDirHexLen) + name);
  }
  std::ranges::sort(out);
  return out;
}

std::vector<std::uint8_t> ObjectStore::raw(std::string_view hex_oid) const {
  const auto path = path_for_hex(hex_oid);
  if (!sfs::exists(path)) {
    throw ObjectNotFound(std::string(hex_oid));
  }
  return sfs::read_file(path);
}

void ObjectStore::put_raw(std::string_view hex_oid, std::span<const std::uint8_t> stored) const {
  const auto path = path_for_hex(hex_oid);
  if (sfs::exists(path)) {
    return;
  }
  const auto framed = sfs::z_decompress(stored);
  if (to_hex(sha1(framed)) != lower(hex_oid)) {
    throw CorruptObject("object " + std::string(hex_oid) + ": content does not match its id");
  }
  sfs::write_file_atomic(path, stored);
}

} // namespace sprig
