#include "util/clock.h"

#include <chrono>

namespace scenelink {
namespace util {

uint32_t SystemClock::millis() const {
  const auto now = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

int64_t SystemClock::unixSeconds() const {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<int64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

}  // namespace util
}  // namespace scenelink
