#ifndef SCENELINK_EDITOR_COMPONENT_H
#define SCENELINK_EDITOR_COMPONENT_H

#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "editor/property.h"

namespace scenelink {
namespace editor {

class Component;
class GameObject;

/**
 * @brief Runtime member reachable by name when no serialized property
 * matches, e.g. Transform.position or Rigidbody.mass.
 *
 * A member without a setter is read-only.
 */
struct ReflectedMember {
  std::string name;
  PropertyKind kind;
  std::vector<std::string> enum_names;
  std::function<PropertyValue(const Component&)> getter;
  std::function<void(Component&, const PropertyValue&)> setter;

  ReflectedMember() : kind(PropertyKind::FLOAT) {}
  bool writable() const { return static_cast<bool>(setter); }
};

struct ComponentType {
  std::string name;        // "Rigidbody"
  std::string name_space;  // "Engine.Physics"
  bool allow_multiple;
  bool removable;
  std::vector<SerializedProperty> defaults;
  std::vector<ReflectedMember> members;

  ComponentType() : allow_multiple(false), removable(true) {}

  std::string fullName() const {
    return name_space.empty() ? name : name_space + "." + name;
  }
  const ReflectedMember* findMember(const std::string& member) const;
};

/**
 * @brief A typed component instance attached to a GameObject.
 *
 * Serialized properties start as a copy of the type's defaults. Runtime
 * values back reflected members that have no serialized field.
 */
class Component {
 public:
  // Everything an undo record needs to put the component back.
  struct State {
    bool enabled;
    std::vector<SerializedProperty> properties;
    std::map<std::string, PropertyValue> runtime;
  };

  Component(const ComponentType& type, int32_t instance_id);

  const ComponentType& type() const { return *_type; }
  const std::string& typeName() const { return _type->name; }
  int32_t instanceId() const { return _instance_id; }

  GameObject* gameObject() const { return _owner; }
  void setGameObject(GameObject* owner) { _owner = owner; }

  bool enabled() const { return _enabled; }
  void setEnabled(bool enabled) { _enabled = enabled; }

  const std::vector<SerializedProperty>& properties() const { return _properties; }
  SerializedProperty* findProperty(const std::string& name);
  const SerializedProperty* findProperty(const std::string& name) const;

  // Value of a serialized property, or a default-constructed value when the
  // type has no such field.
  PropertyValue get(const std::string& name) const;
  // Fails when the property is missing or the kind differs.
  bool set(const std::string& name, const PropertyValue& value);

  PropertyValue runtimeValue(const std::string& name, const PropertyValue& fallback) const;
  void setRuntimeValue(const std::string& name, const PropertyValue& value);

  State captureState() const;
  void swapState(State& state);

 private:
  const ComponentType* _type;
  int32_t _instance_id;
  GameObject* _owner;
  bool _enabled;
  std::vector<SerializedProperty> _properties;
  std::map<std::string, PropertyValue> _runtime;
};

/**
 * @brief Known component types, looked up by the names clients send.
 *
 * Resolution order: exact short name, exact namespace-qualified name, last
 * segment of a qualified name, then a case-insensitive short name.
 */
class ComponentRegistry {
 public:
  // Registers the built-in engine types.
  ComponentRegistry();

  const ComponentType& registerType(const ComponentType& type);
  const ComponentType* find(const std::string& name) const;
  const ComponentType& transformType() const { return *_transform; }
  std::vector<std::string> typeNames() const;

 private:
  void _registerBuiltins();

  std::vector<std::unique_ptr<ComponentType>> _types;
  const ComponentType* _transform;
};

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_COMPONENT_H
