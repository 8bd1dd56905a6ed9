#ifndef SCENELINK_SCHEDULER_H
#define SCENELINK_SCHEDULER_H

#include <stdint.h>

#include "etl/array.h"
#include "etl/algorithm.h"

namespace scenelink {
namespace scheduler {

// IDs for the Controller timer system
enum TimerId : uint8_t {
  TIMER_DISCOVERY_POLL = 0,
  TIMER_HANDSHAKE_TIMEOUT = 1,
  TIMER_RECONNECT_DELAY = 2,
  TIMER_FAST_REPOLL = 3,
  NUMBER_OF_TIMERS = 4
};

class TimerHandler {
 public:
  virtual ~TimerHandler() {}
  virtual void on_timer(TimerId id) = 0;
};

class TimerService {
 public:
  struct TimerEntry {
    TimerHandler* handler;
    TimerId id;
    uint32_t period;
    uint32_t counter;
    bool active;
    bool repeating;
  };

  TimerService() {
    clear();
  }

  void clear() {
    etl::for_each(timers_.begin(), timers_.end(), [](TimerEntry& t) {
      t.handler = nullptr;
      t.active = false;
    });
  }

  void register_timer(TimerHandler* handler, TimerId id, uint32_t period, bool repeating) {
    if (id >= NUMBER_OF_TIMERS) return;
    TimerEntry& t = timers_[id];
    t.handler = handler;
    t.id = id;
    t.period = period;
    t.counter = 0;
    t.active = true;
    t.repeating = repeating;
  }

  void unregister_timer(TimerId id) {
    if (id >= NUMBER_OF_TIMERS) return;
    timers_[id].active = false;
  }

  bool is_active(TimerId id) const {
    return id < NUMBER_OF_TIMERS && timers_[id].active;
  }

  void tick(uint32_t delta_ms) {
    for (uint8_t i = 0; i < NUMBER_OF_TIMERS; ++i) {
      TimerEntry& t = timers_[i];
      if (!t.active) {
        continue;
      }
      t.counter += delta_ms;
      if (t.counter < t.period) {
        continue;
      }
      // Settle the entry before the callback so the handler may re-register
      // or cancel this same timer.
      if (t.repeating) {
        t.counter = 0;
      } else {
        t.active = false;
      }
      if (t.handler) {
        t.handler->on_timer(t.id);
      }
    }
  }

 private:
  etl::array<TimerEntry, NUMBER_OF_TIMERS> timers_;
};

}  // namespace scheduler
}  // namespace scenelink

#endif  // SCENELINK_SCHEDULER_H
