#ifndef SCENELINK_TEST_MANUAL_CLOCK_H
#define SCENELINK_TEST_MANUAL_CLOCK_H

#include <stdint.h>

#include "util/clock.h"

// Clock the tests advance by hand.
class ManualClock : public scenelink::util::Clock {
 public:
  ManualClock() : _millis(1000), _unix(1700000000) {}

  uint32_t millis() const override { return _millis; }
  int64_t unixSeconds() const override { return _unix; }

  void advanceMs(uint32_t ms) {
    _millis += ms;
    _unix += ms / 1000;
  }
  void setUnixSeconds(int64_t seconds) { _unix = seconds; }

 private:
  uint32_t _millis;
  int64_t _unix;
};

#endif  // SCENELINK_TEST_MANUAL_CLOCK_H
