#ifndef SCENELINK_EDITOR_GAME_OBJECT_H
#define SCENELINK_EDITOR_GAME_OBJECT_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "editor/component.h"
#include "editor/math_types.h"

namespace scenelink {
namespace editor {

// Property names of the Transform component.
constexpr const char* kLocalPosition = "m_LocalPosition";
constexpr const char* kLocalRotation = "m_LocalRotation";
constexpr const char* kLocalScale = "m_LocalScale";

/**
 * @brief Scene-graph node. Owns its children and its components; the first
 * component is always the Transform.
 */
class GameObject {
 public:
  GameObject(const std::string& name, int32_t instance_id, std::unique_ptr<Component> transform);

  const std::string& name() const { return _name; }
  void setName(const std::string& name) { _name = name; }
  int32_t instanceId() const { return _instance_id; }

  bool activeSelf() const { return _active; }
  void setActive(bool active) { _active = active; }
  bool activeInHierarchy() const;

  // Hierarchy
  GameObject* parent() const { return _parent; }
  const std::vector<std::unique_ptr<GameObject>>& children() const { return _children; }
  size_t childCount() const { return _children.size(); }
  GameObject* findChild(const std::string& name) const;
  size_t indexOfChild(const GameObject* child) const;
  GameObject* insertChild(std::unique_ptr<GameObject> child, size_t index);
  std::unique_ptr<GameObject> removeChild(GameObject* child, size_t* index_out);

  // "Root/Child/Leaf"
  std::string path() const;

  // Pre-order walk over this object and all descendants.
  void visit(const std::function<void(GameObject&)>& visitor);

  // Components
  const std::vector<std::unique_ptr<Component>>& components() const { return _components; }
  Component& transform() const { return *_components.front(); }
  Component* getComponent(const ComponentType& type) const;
  size_t indexOfComponent(const Component* component) const;
  Component* insertComponent(std::unique_ptr<Component> component, size_t index);
  std::unique_ptr<Component> removeComponent(Component* component, size_t* index_out);

  // Local transform
  Vector3 localPosition() const;
  Quaternion localRotation() const;
  Vector3 localScale() const;
  void setLocalPosition(const Vector3& value);
  void setLocalRotation(const Quaternion& value);
  void setLocalScale(const Vector3& value);

  // World transform, composed through the parent chain.
  Vector3 position() const;
  Quaternion rotation() const;
  Vector3 lossyScale() const;
  void setPosition(const Vector3& value);
  void setRotation(const Quaternion& value);

 private:
  std::string _name;
  int32_t _instance_id;
  bool _active;
  GameObject* _parent;
  std::vector<std::unique_ptr<GameObject>> _children;
  std::vector<std::unique_ptr<Component>> _components;
};

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_GAME_OBJECT_H
