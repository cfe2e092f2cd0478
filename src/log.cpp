#include "sprig/log.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace sprig::log {

namespace {

std::optional<Level> &override_level() {
  static std::optional<Level> level;
  return level;
}

Level from_env() {
  const char *env = std::getenv("SPRIG_LOG");
  if (env == nullptr) {
    return Level::Warn;
  }
  const std::string v(env);
  if (v == "error")
    return Level::Error;
  if (v == "info")
    return Level::Info;
  if (v == "debug")
    return Level::Debug;
  return Level::Warn;
}

const char *label(Level level) {
  switch (level) {
  case Level::Error:
    return "error";
  case Level::Warn:
    return "warning";
  case Level::Info:
    return "info";
  case Level::Debug:
    return "debug";
  }
  return "?";
}

} // namespace

Level threshold() {
  if (override_level()) {
    return *override_level();
  }
  static const Level env_level = from_env();
  return env_level;
}

void set_threshold(Level level) { override_level() = level; }

void write(Level level, std::string_view msg) {
  if (static_cast<int>(level) > static_cast<int>(threshold())) {
    return;
  }
  std::cerr << "sprig: " << label(level) << ": " << msg << "\n";
}

} // namespace sprig::log
