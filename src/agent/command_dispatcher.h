#ifndef SCENELINK_AGENT_COMMAND_DISPATCHER_H
#define SCENELINK_AGENT_COMMAND_DISPATCHER_H

#include <stddef.h>

#include <string>
#include <vector>

#include "agent/command_context.h"
#include "editor/editor_application.h"
#include "protocol/bridge_message.h"

namespace scenelink {
namespace agent {

struct CommandEntry {
  const char* category;
  const char* action;
  CommandHandler handler;
};

/**
 * @brief Fixed "category.action" table over the editor model.
 *
 * dispatch() always produces exactly one Response for the request id:
 * unknown keys, handler errors and exceptions escaping a handler all come
 * back as failed responses.
 */
class CommandDispatcher {
 public:
  explicit CommandDispatcher(editor::EditorApplication& editor);

  rpc::Response dispatch(const rpc::Request& request);

  bool has(const std::string& key) const;
  std::vector<std::string> keys() const;

  static const CommandEntry* table(size_t& count);

 private:
  const CommandEntry* _find(const std::string& category, const std::string& action) const;

  CommandContext _ctx;
};

}  // namespace agent
}  // namespace scenelink

#endif  // SCENELINK_AGENT_COMMAND_DISPATCHER_H
