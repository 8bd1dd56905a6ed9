#include "agent/command_handlers.h"

namespace scenelink {
namespace agent {
namespace commands {

namespace {

Json::Value describeHierarchy(const editor::GameObject& object) {
  Json::Value node(Json::objectValue);
  node["name"] = object.name();
  node["active"] = object.activeSelf();
  Json::Value components(Json::arrayValue);
  for (const auto& component : object.components()) {
    components.append(component->typeName());
  }
  node["components"] = components;
  Json::Value children(Json::arrayValue);
  for (const auto& child : object.children()) {
    children.append(describeHierarchy(*child));
  }
  node["children"] = children;
  return node;
}

Json::Value describeScene(const editor::Scene& scene) {
  Json::Value out(Json::objectValue);
  out["name"] = scene.name();
  out["path"] = scene.path();
  return out;
}

}  // namespace

CommandResult sceneGetActive(CommandContext& ctx, const rpc::ParamMap&) {
  const editor::Scene& scene = ctx.scene();
  Json::Value out = describeScene(scene);
  out["rootCount"] = static_cast<Json::UInt>(scene.rootCount());
  out["isDirty"] = scene.isDirty();
  return out;
}

CommandResult sceneGetHierarchy(CommandContext& ctx, const rpc::ParamMap&) {
  const editor::Scene& scene = ctx.scene();
  Json::Value out(Json::objectValue);
  out["scene"] = scene.name();
  Json::Value hierarchy(Json::arrayValue);
  for (const auto& root : scene.roots()) {
    hierarchy.append(describeHierarchy(*root));
  }
  out["hierarchy"] = hierarchy;
  return out;
}

CommandResult sceneCreate(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string name = param(params, "name", "New Scene");
  ctx.editor.newScene(name);
  if (hasParam(params, "path")) {
    const std::string path = param(params, "path");
    if (!ctx.editor.saveScene(path)) {
      return fail("Failed to save scene at: " + path);
    }
  }
  return describeScene(ctx.scene());
}

CommandResult sceneSave(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "path");
  if (!ctx.editor.saveScene(path)) {
    return fail("Failed to save scene at: " + (path.empty() ? ctx.scene().path() : path));
  }
  return describeScene(ctx.scene());
}

}  // namespace commands
}  // namespace agent
}  // namespace scenelink
