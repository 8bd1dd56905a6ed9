#include "agent/command_handlers.h"

#include <utility>

#include "agent/value_parsing.h"

namespace scenelink {
namespace agent {
namespace commands {

namespace {

Json::Value describeCreated(const editor::GameObject& object) {
  Json::Value out(Json::objectValue);
  out["name"] = object.name();
  out["instanceId"] = object.instanceId();
  out["path"] = object.path();
  return out;
}

// Resolves the optional parentPath parameter. An empty or absent value
// means the scene root.
bool resolveParent(CommandContext& ctx, const rpc::ParamMap& params, editor::GameObject*& out) {
  out = nullptr;
  if (!hasParam(params, "parentPath")) {
    return true;
  }
  out = ctx.scene().find(param(params, "parentPath"));
  return out != nullptr;
}

CommandResult attachCreated(CommandContext& ctx, std::unique_ptr<editor::GameObject> object,
                            editor::GameObject* parent) {
  editor::Scene& scene = ctx.scene();
  const size_t index = parent ? parent->childCount() : scene.rootCount();
  editor::GameObject* created = scene.attach(std::move(object), parent, index);
  ctx.undo().registerCreatedObject(*created, "Create " + created->name());
  ctx.editor.select(created);
  return describeCreated(*created);
}

bool isAncestorOrSelf(const editor::GameObject* candidate, const editor::GameObject* object) {
  for (const editor::GameObject* p = object; p != nullptr; p = p->parent()) {
    if (p == candidate) {
      return true;
    }
  }
  return false;
}

}  // namespace

CommandResult gameObjectCreate(CommandContext& ctx, const rpc::ParamMap& params) {
  editor::GameObject* parent = nullptr;
  if (!resolveParent(ctx, params, parent)) {
    return fail("Parent not found: " + param(params, "parentPath"));
  }
  return attachCreated(ctx, ctx.editor.createGameObject(param(params, "name", "GameObject")), parent);
}

CommandResult gameObjectCreatePrimitive(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string type_name = param(params, "primitiveType", "Cube");
  editor::PrimitiveType type;
  if (!editor::parsePrimitiveType(type_name, type)) {
    return fail("Unknown primitive type: " + type_name +
                ". Valid: Sphere, Capsule, Cylinder, Cube, Plane, Quad");
  }
  editor::GameObject* parent = nullptr;
  if (!resolveParent(ctx, params, parent)) {
    return fail("Parent not found: " + param(params, "parentPath"));
  }
  return attachCreated(ctx, ctx.editor.createPrimitive(type, param(params, "name", "Primitive")),
                       parent);
}

CommandResult gameObjectFind(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = hasParam(params, "gameObjectPath") ? param(params, "gameObjectPath")
                                                              : param(params, "name");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return fail("GameObject not found: " + path);
  }
  Json::Value out(Json::objectValue);
  out["name"] = object->name();
  out["instanceId"] = object->instanceId();
  out["active"] = object->activeSelf();
  out["path"] = object->path();
  return out;
}

CommandResult gameObjectDestroy(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = hasParam(params, "gameObjectPath") ? param(params, "gameObjectPath")
                                                              : param(params, "name");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return fail("GameObject not found: " + path);
  }
  ctx.undo().destroyObjectImmediate(ctx.scene(), *object, "Destroy " + object->name());
  return emptyResult();
}

CommandResult gameObjectSetActive(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return fail("GameObject not found: " + path);
  }
  const std::string text = param(params, "active", "true");
  bool active = true;
  if (!parseBoolean(text, active)) {
    return fail("Cannot convert '" + text + "' to Boolean for active");
  }
  ctx.undo().recordGameObject(*object, "Set Active " + object->name());
  object->setActive(active);
  ctx.scene().markDirty();

  Json::Value out(Json::objectValue);
  out["name"] = object->name();
  out["active"] = object->activeSelf();
  return out;
}

CommandResult gameObjectSetTransform(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return fail("GameObject not found: " + path);
  }

  // Parse everything before touching the object.
  const char* const names[] = {"position", "rotation", "scale"};
  editor::Vector3 values[3];
  bool present[3] = {false, false, false};
  for (size_t i = 0; i < 3; ++i) {
    if (!hasParam(params, names[i])) {
      continue;
    }
    const std::string text = param(params, names[i]);
    if (!parseVector3(text, values[i])) {
      return fail("Cannot convert '" + text + "' to Vector3 for " + names[i]);
    }
    present[i] = true;
  }

  if (present[0] || present[1] || present[2]) {
    ctx.undo().recordComponent(object->transform(), "Set Transform");
    if (present[0]) {
      object->setPosition(values[0]);
    }
    if (present[1]) {
      object->setRotation(editor::Quaternion::fromEuler(values[1]));
    }
    if (present[2]) {
      object->setLocalScale(values[2]);
    }
    ctx.scene().markDirty();
  }

  Json::Value out(Json::objectValue);
  out["name"] = object->name();
  out["position"] = toJsonArray(object->position());
  out["rotation"] = toJsonArray(object->rotation().toEuler());
  out["scale"] = toJsonArray(object->localScale());
  return out;
}

CommandResult gameObjectSetParent(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return fail("GameObject not found: " + path);
  }
  editor::GameObject* parent = nullptr;
  if (!resolveParent(ctx, params, parent)) {
    return fail("Parent not found: " + param(params, "parentPath"));
  }
  if (parent && isAncestorOrSelf(object, parent)) {
    return fail("Cannot parent " + object->name() + " under itself or its children");
  }
  ctx.undo().setTransformParent(ctx.scene(), *object, parent, "Parent " + object->name());

  Json::Value out(Json::objectValue);
  out["name"] = object->name();
  out["path"] = object->path();
  return out;
}

CommandResult gameObjectGetSelected(CommandContext& ctx, const rpc::ParamMap&) {
  Json::Value selected(Json::arrayValue);
  for (const editor::GameObject* object : ctx.editor.selectedObjects()) {
    selected.append(object->name());
  }
  Json::Value out(Json::objectValue);
  out["selected"] = selected;
  return out;
}

}  // namespace commands
}  // namespace agent
}  // namespace scenelink
