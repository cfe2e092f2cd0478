#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sprig {

// Raw 20-byte SHA-1 object id (binary, not hex)
using oid = std::array<std::uint8_t, 20>;

/**
 * Compute SHA-1 of arbitrary bytes.
 * NOTE: object ids hash the framed buffer
 *   "<type>\\0" + payload
 * Use frame_object(...) to build it.
 */
oid sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline oid sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert binary oid to 40-char lowercase hex. */
std::string to_hex(const oid &id);

/**
 * Parse 40-char hex into binary oid.
 * Returns false if length/characters are invalid.
 */
bool from_hex(std::string_view hex, oid &out);

/**
 * Build the stored representation of an object:
 *   "<type>\\0<payload>"
 * The object id is sha1(frame_object(type, payload)).
 */
std::vector<std::uint8_t> frame_object(std::string_view type,
                                       std::span<const std::uint8_t> payload);

/** Hex object id of a typed payload, without touching any store. */
std::string object_id_hex(std::string_view type, std::span<const std::uint8_t> payload);

// Byte/string views used throughout the codebase
inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
  return {reinterpret_cast<const std::uint8_t *>(s.data()), s.size()};
}

inline std::string_view as_text(std::span<const std::uint8_t> bytes) {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

} // namespace sprig
