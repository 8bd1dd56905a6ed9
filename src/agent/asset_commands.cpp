#include "agent/command_handlers.h"

#include <vector>

#include "config/scenelink_config.h"
#include "util/string_utils.h"

namespace scenelink {
namespace agent {
namespace commands {

namespace {

Json::Value makeMaterial(const std::string& name, const std::string& shader) {
  Json::Value color(Json::arrayValue);
  for (int i = 0; i < 4; ++i) {
    color.append(1.0);
  }
  Json::Value out(Json::objectValue);
  out["type"] = "Material";
  out["name"] = name;
  out["shader"] = shader;
  out["color"] = color;
  return out;
}

Json::Value makePhysicMaterial(const std::string& name) {
  Json::Value out(Json::objectValue);
  out["type"] = "PhysicMaterial";
  out["name"] = name;
  out["dynamicFriction"] = 0.6;
  out["staticFriction"] = 0.6;
  out["bounciness"] = 0.0;
  out["frictionCombine"] = "Average";
  out["bounceCombine"] = "Average";
  return out;
}

}  // namespace

CommandResult assetCreate(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string asset_type = param(params, "assetType", "Material");
  const std::string path = param(params, "path");
  if (path.empty()) {
    return fail("path is required");
  }

  const std::string name = util::fileStem(path);
  Json::Value asset;
  const std::string kind = util::toLower(asset_type);
  if (kind == "material") {
    asset = makeMaterial(name, param(params, "shader", "Standard"));
  } else if (kind == "physicmaterial") {
    asset = makePhysicMaterial(name);
  } else {
    return fail("Unsupported asset type: " + asset_type + ". Supported: Material, PhysicMaterial");
  }

  editor::AssetDatabase& assets = ctx.editor.assets();
  const std::string folder = util::parentDirectory(path);
  if (!folder.empty() && !assets.isValidFolder(folder) && !assets.createFolder(folder)) {
    return fail("Failed to create asset at " + path);
  }
  if (!assets.writeJson(path, asset)) {
    return fail("Failed to create asset at " + path);
  }

  Json::Value out(Json::objectValue);
  out["path"] = path;
  out["type"] = asset_type;
  return out;
}

CommandResult assetFind(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::vector<std::string> matches = ctx.editor.assets().find(param(params, "filter"));
  Json::Value assets(Json::arrayValue);
  for (size_t i = 0; i < matches.size() && i < config::kAssetFindLimit; ++i) {
    assets.append(matches[i]);
  }
  Json::Value out(Json::objectValue);
  out["assets"] = assets;
  out["total"] = static_cast<Json::UInt>(matches.size());
  return out;
}

CommandResult assetImport(CommandContext& ctx, const rpc::ParamMap&) {
  ctx.editor.assets().refresh();
  return emptyResult();
}

}  // namespace commands
}  // namespace agent
}  // namespace scenelink
