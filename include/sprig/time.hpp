#pragma once
#include "sprig/config.hpp"
#include <string>

namespace sprig::timeutil {

// "Name <email> <epoch> ±HHMM" for `identity` at the current time and local UTC offset.
auto signature_now(const Identity& identity) -> std::string;

} // namespace sprig::timeutil
