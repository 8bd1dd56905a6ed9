#ifndef SCENELINK_CLOCK_H
#define SCENELINK_CLOCK_H

#include <stdint.h>

namespace scenelink {
namespace util {

// Time source used by every tick-driven component. millis() is monotonic and
// wraps at 2^32 ms; unixSeconds() is wall-clock time used for
// discovery record freshness.
class Clock {
 public:
  virtual ~Clock() {}
  virtual uint32_t millis() const = 0;
  virtual int64_t unixSeconds() const = 0;
};

class SystemClock : public Clock {
 public:
  uint32_t millis() const override;
  int64_t unixSeconds() const override;
};

}  // namespace util
}  // namespace scenelink

#endif  // SCENELINK_CLOCK_H
