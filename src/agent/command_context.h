#ifndef SCENELINK_AGENT_COMMAND_CONTEXT_H
#define SCENELINK_AGENT_COMMAND_CONTEXT_H

#include <string>

#include <json/json.h>

#include "editor/editor_application.h"
#include "etl/expected.h"
#include "protocol/bridge_message.h"

namespace scenelink {
namespace agent {

// Handler outcome: a JSON result or the error text of a failed Response.
typedef etl::expected<Json::Value, std::string> CommandResult;

inline CommandResult fail(const std::string& error) {
  return etl::unexpected<std::string>(error);
}

inline Json::Value emptyResult() {
  return Json::Value(Json::objectValue);
}

// Everything a handler may touch. Handlers run on the editor's main thread.
struct CommandContext {
  editor::EditorApplication& editor;

  explicit CommandContext(editor::EditorApplication& e) : editor(e) {}

  editor::Scene& scene() { return editor.activeScene(); }
  editor::UndoHistory& undo() { return editor.undoHistory(); }
};

inline std::string param(const rpc::ParamMap& params, const std::string& name,
                         const std::string& fallback = "") {
  auto it = params.find(name);
  return it == params.end() ? fallback : it->second;
}

// Present and non-empty.
inline bool hasParam(const rpc::ParamMap& params, const std::string& name) {
  auto it = params.find(name);
  return it != params.end() && !it->second.empty();
}

typedef CommandResult (*CommandHandler)(CommandContext& ctx, const rpc::ParamMap& params);

}  // namespace agent
}  // namespace scenelink

#endif  // SCENELINK_AGENT_COMMAND_CONTEXT_H
