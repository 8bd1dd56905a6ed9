#include "editor/scene_serializer.h"

#include <string>
#include <utility>

#include "util/log.h"

namespace scenelink {
namespace editor {

namespace {

Json::Value serializeComponent(const Component& component) {
  Json::Value out(Json::objectValue);
  out["type"] = component.type().fullName();
  out["enabled"] = component.enabled();
  Json::Value properties(Json::objectValue);
  for (const SerializedProperty& p : component.properties()) {
    properties[p.name] = toJson(p.value, p.enum_names);
  }
  out["properties"] = properties;
  return out;
}

void applyProperties(const Json::Value& json, Component& component) {
  if (!json.isObject()) {
    return;
  }
  for (const std::string& name : json.getMemberNames()) {
    SerializedProperty* p = component.findProperty(name);
    if (!p) {
      log::get()->warn("serializer: {} has no property {}", component.typeName(), name);
      continue;
    }
    PropertyValue value;
    if (!fromJson(json[name], p->value.kind, p->enum_names, value)) {
      log::get()->warn("serializer: bad value for {}.{}", component.typeName(), name);
      continue;
    }
    p->value = value;
  }
}

}  // namespace

Json::Value serializeGameObject(const GameObject& object) {
  Json::Value out(Json::objectValue);
  out["name"] = object.name();
  out["active"] = object.activeSelf();
  Json::Value components(Json::arrayValue);
  for (const auto& component : object.components()) {
    components.append(serializeComponent(*component));
  }
  out["components"] = components;
  Json::Value children(Json::arrayValue);
  for (const auto& child : object.children()) {
    children.append(serializeGameObject(*child));
  }
  out["children"] = children;
  return out;
}

std::unique_ptr<GameObject> deserializeGameObject(const Json::Value& json,
                                                  const ComponentRegistry& registry,
                                                  const InstanceIdAllocator& next_id) {
  if (!json.isObject()) {
    return std::unique_ptr<GameObject>();
  }
  const std::string name = json.get("name", "GameObject").asString();
  const int32_t object_id = next_id();
  std::unique_ptr<GameObject> object(new GameObject(
      name, object_id,
      std::unique_ptr<Component>(new Component(registry.transformType(), next_id()))));
  object->setActive(json.get("active", true).asBool());

  const Json::Value& components = json["components"];
  if (components.isArray()) {
    for (const Json::Value& entry : components) {
      if (!entry.isObject()) {
        continue;
      }
      const ComponentType* type = registry.find(entry.get("type", "").asString());
      if (!type) {
        log::get()->warn("serializer: unknown component type '{}' on {}",
                         entry.get("type", "").asString(), name);
        continue;
      }
      Component* component = nullptr;
      if (type == &registry.transformType()) {
        component = &object->transform();
      } else {
        component = object->insertComponent(
            std::unique_ptr<Component>(new Component(*type, next_id())),
            object->components().size());
      }
      component->setEnabled(entry.get("enabled", true).asBool());
      applyProperties(entry["properties"], *component);
    }
  }

  const Json::Value& children = json["children"];
  if (children.isArray()) {
    for (const Json::Value& entry : children) {
      std::unique_ptr<GameObject> child = deserializeGameObject(entry, registry, next_id);
      if (child) {
        object->insertChild(std::move(child), object->childCount());
      }
    }
  }
  return object;
}

Json::Value serializeScene(const Scene& scene) {
  Json::Value out(Json::objectValue);
  out["name"] = scene.name();
  Json::Value roots(Json::arrayValue);
  for (const auto& root : scene.roots()) {
    roots.append(serializeGameObject(*root));
  }
  out["roots"] = roots;
  return out;
}

}  // namespace editor
}  // namespace scenelink
