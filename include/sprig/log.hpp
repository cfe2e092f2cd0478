#pragma once
#include <cstdint>
#include <string_view>

namespace sprig::log {

enum class Level : std::uint8_t { Error, Warn, Info, Debug };

// Threshold read once from $SPRIG_LOG ("error", "warn", "info", "debug"); default Warn.
Level threshold();

// Override the threshold (CLI -v, tests).
void set_threshold(Level level);

// Write "sprig: <level>: <msg>" to stderr when `level` passes the threshold.
void write(Level level, std::string_view msg);

inline void error(std::string_view msg) { write(Level::Error, msg); }
inline void warn(std::string_view msg) { write(Level::Warn, msg); }
inline void info(std::string_view msg) { write(Level::Info, msg); }
inline void debug(std::string_view msg) { write(Level::Debug, msg); }

} // namespace sprig::log
