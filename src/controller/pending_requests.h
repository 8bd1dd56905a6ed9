#ifndef SCENELINK_PENDING_REQUESTS_H
#define SCENELINK_PENDING_REQUESTS_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <map>
#include <string>

#include "protocol/bridge_message.h"

namespace scenelink {
namespace controller {

enum class CommandStatus : uint8_t {
  COMPLETED,          // a Response arrived (success or failure)
  TIMEOUT,            // no Response within the budget
  CONNECTION_CLOSED,  // the channel closed while waiting
  CANCELLED           // disconnect() by the user
};

const char* toString(CommandStatus status);

// Delivered exactly once per accepted sendCommand(). For anything but
// COMPLETED, response.success is false and response.error explains why.
struct CommandOutcome {
  CommandStatus status;
  rpc::Response response;

  bool ok() const { return status == CommandStatus::COMPLETED && response.success; }
};

typedef std::function<void(const CommandOutcome&)> ResponseHandler;

/**
 * @brief Correlation table of in-flight requests keyed by request id.
 *
 * Entries are removed before their handler runs, so a handler can never be
 * invoked twice and may itself send new commands.
 */
class PendingRequestTable {
 public:
  void add(const std::string& id, const std::string& command_key,
           uint32_t now_ms, uint32_t timeout_ms, const ResponseHandler& handler);

  // Drops an entry without invoking its handler (the request never left).
  bool discard(const std::string& id) { return _entries.erase(id) != 0; }

  // False when the id is not pending (late or unknown response).
  bool resolve(const rpc::Response& response);

  // Fails every entry whose budget elapsed. Returns how many expired.
  size_t expire(uint32_t now_ms);

  // Fails every entry with the given status. Returns how many were rejected.
  size_t rejectAll(CommandStatus status, const std::string& error);

  size_t size() const { return _entries.size(); }
  bool contains(const std::string& id) const { return _entries.count(id) != 0; }

 private:
  struct Entry {
    std::string command_key;
    uint32_t started_ms;
    uint32_t timeout_ms;
    ResponseHandler handler;
  };

  static void _complete(const Entry& entry, CommandStatus status,
                        const rpc::Response& response);

  std::map<std::string, Entry> _entries;
};

}  // namespace controller
}  // namespace scenelink

#endif  // SCENELINK_PENDING_REQUESTS_H
