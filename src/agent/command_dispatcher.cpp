#include "agent/command_dispatcher.h"

#include <exception>

#include "agent/command_handlers.h"
#include "util/log.h"

namespace scenelink {
namespace agent {

namespace {

const CommandEntry kCommandTable[] = {
  {"scene", "getActive", &commands::sceneGetActive},
  {"scene", "getHierarchy", &commands::sceneGetHierarchy},
  {"scene", "create", &commands::sceneCreate},
  {"scene", "save", &commands::sceneSave},

  {"gameObject", "create", &commands::gameObjectCreate},
  {"gameObject", "createPrimitive", &commands::gameObjectCreatePrimitive},
  {"gameObject", "find", &commands::gameObjectFind},
  {"gameObject", "destroy", &commands::gameObjectDestroy},
  {"gameObject", "setActive", &commands::gameObjectSetActive},
  {"gameObject", "setTransform", &commands::gameObjectSetTransform},
  {"gameObject", "setParent", &commands::gameObjectSetParent},
  {"gameObject", "getSelected", &commands::gameObjectGetSelected},

  {"component", "add", &commands::componentAdd},
  {"component", "remove", &commands::componentRemove},
  {"component", "getAll", &commands::componentGetAll},
  {"component", "setProperty", &commands::componentSetProperty},

  {"prefab", "create", &commands::prefabCreate},
  {"prefab", "instantiate", &commands::prefabInstantiate},
  {"prefab", "getAll", &commands::prefabGetAll},

  {"asset", "create", &commands::assetCreate},
  {"asset", "find", &commands::assetFind},
  {"asset", "import", &commands::assetImport},

  {"editor", "getPlayMode", &commands::editorGetPlayMode},
  {"editor", "play", &commands::editorPlay},
  {"editor", "pause", &commands::editorPause},
  {"editor", "stop", &commands::editorStop},
  {"editor", "executeMenuItem", &commands::editorExecuteMenuItem},
  {"editor", "undo", &commands::editorUndo},
  {"editor", "redo", &commands::editorRedo},

  {"project", "getInfo", &commands::projectGetInfo},
  {"project", "refresh", &commands::projectRefresh},
};

constexpr size_t kCommandCount = sizeof(kCommandTable) / sizeof(kCommandTable[0]);

}  // namespace

CommandDispatcher::CommandDispatcher(editor::EditorApplication& editor) : _ctx(editor) {}

const CommandEntry* CommandDispatcher::table(size_t& count) {
  count = kCommandCount;
  return kCommandTable;
}

const CommandEntry* CommandDispatcher::_find(const std::string& category,
                                             const std::string& action) const {
  for (const CommandEntry& entry : kCommandTable) {
    if (category == entry.category && action == entry.action) {
      return &entry;
    }
  }
  return nullptr;
}

bool CommandDispatcher::has(const std::string& key) const {
  const size_t dot = key.find('.');
  if (dot == std::string::npos) {
    return false;
  }
  return _find(key.substr(0, dot), key.substr(dot + 1)) != nullptr;
}

std::vector<std::string> CommandDispatcher::keys() const {
  std::vector<std::string> out;
  out.reserve(kCommandCount);
  for (const CommandEntry& entry : kCommandTable) {
    out.push_back(std::string(entry.category) + "." + entry.action);
  }
  return out;
}

rpc::Response CommandDispatcher::dispatch(const rpc::Request& request) {
  const std::string key = request.key();
  const CommandEntry* entry = _find(request.category, request.action);
  if (!entry) {
    log::get()->warn("dispatch: unknown command {}", key);
    return rpc::Response::failure(request.id, rpc::RPC_ERROR_UNKNOWN_COMMAND_PREFIX + key);
  }

  log::get()->debug("dispatch: {} ({})", key, request.id);
  try {
    CommandResult result = entry->handler(_ctx, request.params);
    if (!result.has_value()) {
      log::get()->debug("dispatch: {} failed: {}", key, result.error());
      return rpc::Response::failure(request.id, result.error());
    }
    return rpc::Response::ok(request.id, result.value());
  } catch (const std::exception& e) {
    log::get()->error("dispatch: {} threw: {}", key, e.what());
    return rpc::Response::failure(request.id, e.what());
  }
}

}  // namespace agent
}  // namespace scenelink
