#include "controller/pending_requests.h"

#include <vector>

#include "util/log.h"

namespace scenelink {
namespace controller {

const char* toString(CommandStatus status) {
  switch (status) {
    case CommandStatus::COMPLETED:         return "completed";
    case CommandStatus::TIMEOUT:           return "timeout";
    case CommandStatus::CONNECTION_CLOSED: return "connection closed";
    case CommandStatus::CANCELLED:         return "cancelled";
  }
  return "unknown";
}

void PendingRequestTable::add(const std::string& id, const std::string& command_key,
                              uint32_t now_ms, uint32_t timeout_ms,
                              const ResponseHandler& handler) {
  Entry entry;
  entry.command_key = command_key;
  entry.started_ms = now_ms;
  entry.timeout_ms = timeout_ms;
  entry.handler = handler;
  _entries[id] = entry;
}

bool PendingRequestTable::resolve(const rpc::Response& response) {
  std::map<std::string, Entry>::iterator it = _entries.find(response.id);
  if (it == _entries.end()) {
    log::get()->debug("discarding response for non-pending id {}", response.id);
    return false;
  }
  const Entry entry = it->second;
  _entries.erase(it);
  _complete(entry, CommandStatus::COMPLETED, response);
  return true;
}

size_t PendingRequestTable::expire(uint32_t now_ms) {
  std::vector<std::pair<std::string, Entry> > expired;
  for (std::map<std::string, Entry>::iterator it = _entries.begin(); it != _entries.end();) {
    if (now_ms - it->second.started_ms >= it->second.timeout_ms) {
      expired.push_back(*it);
      it = _entries.erase(it);
    } else {
      ++it;
    }
  }
  for (size_t i = 0; i < expired.size(); ++i) {
    const std::string error = std::string(rpc::RPC_ERROR_TIMEOUT_PREFIX) + expired[i].second.command_key;
    log::get()->warn("{}", error);
    _complete(expired[i].second, CommandStatus::TIMEOUT,
              rpc::Response::failure(expired[i].first, error));
  }
  return expired.size();
}

size_t PendingRequestTable::rejectAll(CommandStatus status, const std::string& error) {
  std::map<std::string, Entry> rejected;
  rejected.swap(_entries);
  for (std::map<std::string, Entry>::const_iterator it = rejected.begin(); it != rejected.end(); ++it) {
    _complete(it->second, status, rpc::Response::failure(it->first, error));
  }
  return rejected.size();
}

void PendingRequestTable::_complete(const Entry& entry, CommandStatus status,
                                    const rpc::Response& response) {
  if (!entry.handler) {
    return;
  }
  CommandOutcome outcome;
  outcome.status = status;
  outcome.response = response;
  entry.handler(outcome);
}

}  // namespace controller
}  // namespace scenelink
