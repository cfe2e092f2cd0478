#pragma once
#include "sprig/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sprig {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit"
  std::vector<std::uint8_t> data;    // payload bytes (no framing)
};

// Append-only, content-addressed storage under <repo>/.sprig/objects.
// Each object lives in objects/aa/bbbb... as zlib-deflated "<type>\0<payload>".
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path objects_dir)
    : objects_dir_(std::move(objects_dir)) {}

  // Write object with given type/payload if absent. Returns 40-hex id.
  std::string put(std::string_view type, std::span<const std::uint8_t> payload) const;

  // Read object; throws ObjectNotFound, or TypeMismatch when `expected_type` differs.
  Object get(std::string_view hex_oid,
             std::optional<std::string_view> expected_type = std::nullopt) const;

  [[nodiscard]] bool exists(std::string_view hex_oid) const;

  // All stored ids starting with `hex_prefix` (case-insensitive), sorted.
  std::vector<std::string> find_by_prefix(std::string_view hex_prefix) const;

  // Stored (compressed) representation, for copying between stores.
  std::vector<std::uint8_t> raw(std::string_view hex_oid) const;

  // Install a stored representation fetched elsewhere; the content must hash to `hex_oid`.
  void put_raw(std::string_view hex_oid, std::span<const std::uint8_t> stored) const;

  // Get filesystem path for a binary oid.
  std::filesystem::path path_for_oid(const oid& object_id) const;

  const std::filesystem::path& dir() const { return objects_dir_; }

private:
  std::filesystem::path path_for_hex(std::string_view hex_oid) const;

  std::filesystem::path objects_dir_;
};

} // namespace sprig
