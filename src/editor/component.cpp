#include "editor/component.h"

#include <utility>

#include "util/string_utils.h"

namespace scenelink {
namespace editor {

const ReflectedMember* ComponentType::findMember(const std::string& member) const {
  for (const ReflectedMember& m : members) {
    if (m.name == member) {
      return &m;
    }
  }
  return nullptr;
}

Component::Component(const ComponentType& type, int32_t instance_id)
  : _type(&type)
  , _instance_id(instance_id)
  , _owner(nullptr)
  , _enabled(true)
  , _properties(type.defaults)
{
}

SerializedProperty* Component::findProperty(const std::string& name) {
  for (SerializedProperty& p : _properties) {
    if (p.name == name) {
      return &p;
    }
  }
  return nullptr;
}

const SerializedProperty* Component::findProperty(const std::string& name) const {
  for (const SerializedProperty& p : _properties) {
    if (p.name == name) {
      return &p;
    }
  }
  return nullptr;
}

PropertyValue Component::get(const std::string& name) const {
  const SerializedProperty* p = findProperty(name);
  return p ? p->value : PropertyValue();
}

bool Component::set(const std::string& name, const PropertyValue& value) {
  SerializedProperty* p = findProperty(name);
  if (!p || p->value.kind != value.kind) {
    return false;
  }
  p->value = value;
  return true;
}

PropertyValue Component::runtimeValue(const std::string& name, const PropertyValue& fallback) const {
  auto it = _runtime.find(name);
  return it == _runtime.end() ? fallback : it->second;
}

void Component::setRuntimeValue(const std::string& name, const PropertyValue& value) {
  _runtime[name] = value;
}

Component::State Component::captureState() const {
  State state;
  state.enabled = _enabled;
  state.properties = _properties;
  state.runtime = _runtime;
  return state;
}

void Component::swapState(State& state) {
  std::swap(_enabled, state.enabled);
  _properties.swap(state.properties);
  _runtime.swap(state.runtime);
}

ComponentRegistry::ComponentRegistry() : _transform(nullptr) {
  _registerBuiltins();
}

const ComponentType& ComponentRegistry::registerType(const ComponentType& type) {
  for (auto& existing : _types) {
    if (existing->fullName() == type.fullName()) {
      *existing = type;
      return *existing;
    }
  }
  _types.push_back(std::unique_ptr<ComponentType>(new ComponentType(type)));
  return *_types.back();
}

const ComponentType* ComponentRegistry::find(const std::string& name) const {
  if (name.empty()) {
    return nullptr;
  }
  for (const auto& type : _types) {
    if (type->name == name || type->fullName() == name) {
      return type.get();
    }
  }
  const size_t dot = name.find_last_of('.');
  if (dot != std::string::npos) {
    const std::string short_name = name.substr(dot + 1);
    for (const auto& type : _types) {
      if (type->name == short_name) {
        return type.get();
      }
    }
  }
  for (const auto& type : _types) {
    if (util::equalsIgnoreCase(type->name, name)) {
      return type.get();
    }
  }
  return nullptr;
}

std::vector<std::string> ComponentRegistry::typeNames() const {
  std::vector<std::string> names;
  names.reserve(_types.size());
  for (const auto& type : _types) {
    names.push_back(type->name);
  }
  return names;
}

}  // namespace editor
}  // namespace scenelink
