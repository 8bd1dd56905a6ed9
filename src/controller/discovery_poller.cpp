#include "controller/discovery_poller.h"

#include <errno.h>
#include <string.h>

#include "util/log.h"

namespace scenelink {
namespace controller {

const char* toString(PollOutcome outcome) {
  switch (outcome) {
    case PollOutcome::NO_RECORD:     return "no record";
    case PollOutcome::MALFORMED:     return "malformed";
    case PollOutcome::STALE_REMOVED: return "stale";
    case PollOutcome::FRESH:         return "fresh";
  }
  return "unknown";
}

DiscoveryPoller::DiscoveryPoller(const std::string& project_root, uint32_t stale_seconds,
                                 const util::Clock& clock)
    : _path(rpc::discoveryPath(project_root)),
      _stale_seconds(stale_seconds),
      _clock(clock) {}

PollOutcome DiscoveryPoller::poll(rpc::DiscoveryRecord& out) {
  etl::expected<rpc::DiscoveryRecord, rpc::DiscoveryError> result = rpc::readDiscoveryRecord(_path);
  if (!result.has_value()) {
    if (result.error() == rpc::DiscoveryError::NOT_FOUND) {
      return PollOutcome::NO_RECORD;
    }
    log::get()->debug("ignoring discovery record {}: {}", _path, rpc::toString(result.error()));
    return PollOutcome::MALFORMED;
  }

  const rpc::DiscoveryRecord& record = result.value();
  const int64_t now = _clock.unixSeconds();
  if (rpc::isStale(record, now, _stale_seconds)) {
    log::get()->warn("removing stale discovery record (port {}, age {}s)", record.port,
                     now - record.timestamp);
    if (!rpc::removeDiscoveryRecord(_path)) {
      log::get()->warn("could not remove {}: {}", _path, strerror(errno));
    }
    return PollOutcome::STALE_REMOVED;
  }

  out = record;
  return PollOutcome::FRESH;
}

}  // namespace controller
}  // namespace scenelink
