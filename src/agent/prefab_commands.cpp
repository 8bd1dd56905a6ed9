#include "agent/command_handlers.h"

#include <utility>

#include "editor/scene_serializer.h"
#include "util/string_utils.h"

namespace scenelink {
namespace agent {
namespace commands {

namespace {

constexpr const char* kPrefabFolder = "Assets/Prefabs";
constexpr const char* kPrefabExtension = ".prefab";

}  // namespace

CommandResult prefabCreate(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return fail("GameObject not found: " + path);
  }
  const std::string asset_path =
      param(params, "assetPath",
            std::string(kPrefabFolder) + "/" + object->name() + kPrefabExtension);
  if (!util::endsWith(asset_path, kPrefabExtension)) {
    return fail("Prefab path must end with " + std::string(kPrefabExtension) + ": " + asset_path);
  }

  editor::AssetDatabase& assets = ctx.editor.assets();
  const std::string folder = util::parentDirectory(asset_path);
  if (!folder.empty() && !assets.isValidFolder(folder) && !assets.createFolder(folder)) {
    return fail("Failed to create prefab at " + asset_path);
  }
  Json::Value prefab(Json::objectValue);
  prefab["type"] = "Prefab";
  prefab["root"] = editor::serializeGameObject(*object);
  if (!assets.writeJson(asset_path, prefab)) {
    return fail("Failed to create prefab at " + asset_path);
  }

  Json::Value out(Json::objectValue);
  out["path"] = asset_path;
  out["name"] = util::fileStem(asset_path);
  return out;
}

CommandResult prefabInstantiate(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string prefab_path = param(params, "prefabPath");
  Json::Value prefab;
  if (prefab_path.empty() || !ctx.editor.assets().readJson(prefab_path, prefab) ||
      !prefab.isObject() || prefab.get("type", "").asString() != "Prefab") {
    return fail("Prefab not found at: " + prefab_path);
  }
  editor::EditorApplication& app = ctx.editor;
  std::unique_ptr<editor::GameObject> instance = editor::deserializeGameObject(
      prefab["root"], app.components(), [&app]() { return app.allocateInstanceId(); });
  if (!instance) {
    return fail("Prefab not found at: " + prefab_path);
  }
  // The instance takes the asset's name, as a fresh drag into the scene would.
  instance->setName(util::fileStem(prefab_path));

  editor::Scene& scene = ctx.scene();
  editor::GameObject* created = scene.attach(std::move(instance), nullptr, scene.rootCount());
  ctx.undo().registerCreatedObject(*created, "Instantiate " + created->name());
  app.select(created);

  Json::Value out(Json::objectValue);
  out["name"] = created->name();
  out["instanceId"] = created->instanceId();
  return out;
}

CommandResult prefabGetAll(CommandContext& ctx, const rpc::ParamMap&) {
  Json::Value prefabs(Json::arrayValue);
  for (const std::string& path : ctx.editor.assets().find("t:Prefab")) {
    prefabs.append(path);
  }
  Json::Value out(Json::objectValue);
  out["prefabs"] = prefabs;
  return out;
}

}  // namespace commands
}  // namespace agent
}  // namespace scenelink
