#include "sprig/time.hpp"

#include <cstdio>
#include <ctime>

namespace {

#if defined(_WIN32)
std::time_t as_utc_epoch(std::tm *t) { return _mkgmtime(t); }
#else
std::time_t as_utc_epoch(std::tm *t) { return timegm(t); }
#endif

// Minutes east of UTC at `t` in the local timezone.
int utc_offset_minutes(std::time_t t) {
  std::tm local{};
  std::tm utc{};
#if defined(_WIN32)
  localtime_s(&local, &t);
  gmtime_s(&utc, &t);
#else
  localtime_r(&t, &local);
  gmtime_r(&t, &utc);
#endif
  return static_cast<int>((as_utc_epoch(&local) - as_utc_epoch(&utc)) / 60);
}

std::string offset_text(int minutes) {
  const int m = minutes < 0 ? -minutes : minutes;
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%c%02d%02d", minutes < 0 ? '-' : '+', (m / 60) % 100, m % 60);
  return buf;
}

} // namespace

namespace sprig::timeutil {

std::string signature_now(const Identity &identity) {
  const std::time_t now = std::time(nullptr);
  return identity.name + " <" + identity.email + "> " +
         std::to_string(static_cast<long long>(now)) + " " + offset_text(utc_offset_minutes(now));
}

} // namespace sprig::timeutil
