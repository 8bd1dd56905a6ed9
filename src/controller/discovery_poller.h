#ifndef SCENELINK_DISCOVERY_POLLER_H
#define SCENELINK_DISCOVERY_POLLER_H

#include <stdint.h>

#include <string>

#include "protocol/discovery_record.h"
#include "util/clock.h"

namespace scenelink {
namespace controller {

enum class PollOutcome : uint8_t {
  NO_RECORD,      // engine not running; expected
  MALFORMED,      // unreadable or invalid; ignored until rewritten
  STALE_REMOVED,  // older than the threshold; deleted
  FRESH           // usable; out is filled
};

const char* toString(PollOutcome outcome);

// Reads the discovery record and applies the freshness policy. Never writes
// the record; may delete it when stale.
class DiscoveryPoller {
 public:
  DiscoveryPoller(const std::string& project_root, uint32_t stale_seconds,
                  const util::Clock& clock);

  PollOutcome poll(rpc::DiscoveryRecord& out);

  const std::string& path() const { return _path; }

 private:
  std::string _path;
  uint32_t _stale_seconds;
  const util::Clock& _clock;
};

}  // namespace controller
}  // namespace scenelink

#endif  // SCENELINK_DISCOVERY_POLLER_H
