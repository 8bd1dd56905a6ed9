#include "agent/command_handlers.h"

#include "agent/value_parsing.h"

namespace scenelink {
namespace agent {
namespace commands {

namespace {

CommandResult missingObject(const std::string& path) {
  return fail("GameObject not found: " + path);
}

CommandResult missingComponent(const std::string& type_name, const editor::GameObject& object) {
  return fail("Component not found: " + type_name + " on " + object.name());
}

Json::Value describeComponent(const editor::Component& component) {
  Json::Value properties(Json::objectValue);
  for (const editor::SerializedProperty& p : component.properties()) {
    properties[p.name] = editor::toJson(p.value, p.enum_names);
  }
  for (const editor::ReflectedMember& member : component.type().members) {
    if (member.getter && !properties.isMember(member.name)) {
      properties[member.name] = editor::toJson(member.getter(component), member.enum_names);
    }
  }
  Json::Value out(Json::objectValue);
  out["type"] = component.typeName();
  out["enabled"] = component.enabled();
  out["properties"] = properties;
  return out;
}

Json::Value propertySet(const std::string& name) {
  Json::Value out(Json::objectValue);
  out["property"] = name;
  out["set"] = true;
  return out;
}

CommandResult conversionError(const std::string& value, editor::PropertyKind kind,
                              const std::string& property) {
  return fail("Cannot convert '" + value + "' to " + editor::toString(kind) + " for " + property);
}

}  // namespace

CommandResult componentAdd(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return missingObject(path);
  }
  const std::string type_name = param(params, "componentType");
  const editor::ComponentType* type = ctx.editor.components().find(type_name);
  if (!type) {
    return fail("Component type not found: " + type_name);
  }
  if (!type->allow_multiple && object->getComponent(*type)) {
    return fail("Component " + type->name + " already present on " + object->name());
  }
  editor::Component* component = ctx.editor.addComponent(*object, *type);
  ctx.undo().registerAddedComponent(*component, "Add " + type->name);
  ctx.scene().markDirty();

  Json::Value out(Json::objectValue);
  out["gameObject"] = object->name();
  out["component"] = type->name;
  return out;
}

CommandResult componentRemove(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return missingObject(path);
  }
  const std::string type_name = param(params, "componentType");
  const editor::ComponentType* type = ctx.editor.components().find(type_name);
  editor::Component* component = type ? object->getComponent(*type) : nullptr;
  if (!component) {
    return missingComponent(type_name, *object);
  }
  if (!type->removable) {
    return fail("Component " + type->name + " cannot be removed");
  }
  ctx.undo().destroyComponentImmediate(*component, "Remove " + type->name);
  ctx.scene().markDirty();
  return emptyResult();
}

CommandResult componentGetAll(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return missingObject(path);
  }
  Json::Value components(Json::arrayValue);
  for (const auto& component : object->components()) {
    components.append(describeComponent(*component));
  }
  Json::Value out(Json::objectValue);
  out["gameObject"] = object->name();
  out["components"] = components;
  return out;
}

CommandResult componentSetProperty(CommandContext& ctx, const rpc::ParamMap& params) {
  const std::string path = param(params, "gameObjectPath");
  editor::GameObject* object = ctx.scene().find(path);
  if (!object) {
    return missingObject(path);
  }
  const std::string type_name = param(params, "componentType");
  const editor::ComponentType* type = ctx.editor.components().find(type_name);
  editor::Component* component = type ? object->getComponent(*type) : nullptr;
  if (!component) {
    return missingComponent(type_name, *object);
  }

  const std::string name = param(params, "propertyName");
  const std::string text = param(params, "value");
  const std::string undo_name = "Set " + name + " on " + object->name();

  // Serialized field first; it is what scene and prefab files persist.
  editor::SerializedProperty* field = component->findProperty(name);
  if (field) {
    editor::PropertyValue value;
    if (!coerceValue(text, field->value.kind, field->enum_names, value)) {
      return conversionError(text, field->value.kind, name);
    }
    ctx.undo().recordComponent(*component, undo_name);
    field->value = value;
    ctx.scene().markDirty();
    return propertySet(name);
  }

  const editor::ReflectedMember* member = type->findMember(name);
  if (member && member->writable()) {
    editor::PropertyValue value;
    if (!coerceValue(text, member->kind, member->enum_names, value)) {
      return conversionError(text, member->kind, name);
    }
    ctx.undo().recordComponent(*component, undo_name);
    member->setter(*component, value);
    ctx.scene().markDirty();
    return propertySet(name);
  }

  return fail("Property not found: " + name + " on " + type_name);
}

}  // namespace commands
}  // namespace agent
}  // namespace scenelink
