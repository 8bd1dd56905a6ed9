#include "editor/game_object.h"

#include <utility>

namespace scenelink {
namespace editor {

GameObject::GameObject(const std::string& name, int32_t instance_id,
                       std::unique_ptr<Component> transform)
  : _name(name)
  , _instance_id(instance_id)
  , _active(true)
  , _parent(nullptr)
{
  transform->setGameObject(this);
  _components.push_back(std::move(transform));
}

bool GameObject::activeInHierarchy() const {
  for (const GameObject* go = this; go != nullptr; go = go->_parent) {
    if (!go->_active) {
      return false;
    }
  }
  return true;
}

GameObject* GameObject::findChild(const std::string& name) const {
  for (const auto& child : _children) {
    if (child->_name == name) {
      return child.get();
    }
  }
  return nullptr;
}

size_t GameObject::indexOfChild(const GameObject* child) const {
  for (size_t i = 0; i < _children.size(); ++i) {
    if (_children[i].get() == child) {
      return i;
    }
  }
  return _children.size();
}

GameObject* GameObject::insertChild(std::unique_ptr<GameObject> child, size_t index) {
  if (index > _children.size()) {
    index = _children.size();
  }
  child->_parent = this;
  GameObject* raw = child.get();
  _children.insert(_children.begin() + static_cast<ptrdiff_t>(index), std::move(child));
  return raw;
}

std::unique_ptr<GameObject> GameObject::removeChild(GameObject* child, size_t* index_out) {
  const size_t index = indexOfChild(child);
  if (index == _children.size()) {
    return std::unique_ptr<GameObject>();
  }
  std::unique_ptr<GameObject> out = std::move(_children[index]);
  _children.erase(_children.begin() + static_cast<ptrdiff_t>(index));
  out->_parent = nullptr;
  if (index_out) {
    *index_out = index;
  }
  return out;
}

std::string GameObject::path() const {
  return _parent ? _parent->path() + "/" + _name : _name;
}

void GameObject::visit(const std::function<void(GameObject&)>& visitor) {
  visitor(*this);
  for (auto& child : _children) {
    child->visit(visitor);
  }
}

Component* GameObject::getComponent(const ComponentType& type) const {
  for (const auto& component : _components) {
    if (&component->type() == &type) {
      return component.get();
    }
  }
  return nullptr;
}

size_t GameObject::indexOfComponent(const Component* component) const {
  for (size_t i = 0; i < _components.size(); ++i) {
    if (_components[i].get() == component) {
      return i;
    }
  }
  return _components.size();
}

Component* GameObject::insertComponent(std::unique_ptr<Component> component, size_t index) {
  // Slot 0 belongs to the Transform.
  if (index == 0) {
    index = 1;
  }
  if (index > _components.size()) {
    index = _components.size();
  }
  component->setGameObject(this);
  Component* raw = component.get();
  _components.insert(_components.begin() + static_cast<ptrdiff_t>(index), std::move(component));
  return raw;
}

std::unique_ptr<Component> GameObject::removeComponent(Component* component, size_t* index_out) {
  const size_t index = indexOfComponent(component);
  if (index == 0 || index == _components.size()) {
    return std::unique_ptr<Component>();
  }
  std::unique_ptr<Component> out = std::move(_components[index]);
  _components.erase(_components.begin() + static_cast<ptrdiff_t>(index));
  out->setGameObject(nullptr);
  if (index_out) {
    *index_out = index;
  }
  return out;
}

Vector3 GameObject::localPosition() const {
  return transform().get(kLocalPosition).asVector3();
}

Quaternion GameObject::localRotation() const {
  return transform().get(kLocalRotation).asQuaternion();
}

Vector3 GameObject::localScale() const {
  return transform().get(kLocalScale).asVector3();
}

void GameObject::setLocalPosition(const Vector3& value) {
  transform().set(kLocalPosition, PropertyValue::vector3(value));
}

void GameObject::setLocalRotation(const Quaternion& value) {
  transform().set(kLocalRotation, PropertyValue::vector4(Vector4(value.x, value.y, value.z, value.w)));
}

void GameObject::setLocalScale(const Vector3& value) {
  transform().set(kLocalScale, PropertyValue::vector3(value));
}

Vector3 GameObject::position() const {
  if (!_parent) {
    return localPosition();
  }
  const Vector3 scaled = localPosition().scaled(_parent->lossyScale());
  return _parent->position() + _parent->rotation().rotate(scaled);
}

Quaternion GameObject::rotation() const {
  return _parent ? _parent->rotation() * localRotation() : localRotation();
}

Vector3 GameObject::lossyScale() const {
  return _parent ? localScale().scaled(_parent->lossyScale()) : localScale();
}

void GameObject::setPosition(const Vector3& value) {
  if (!_parent) {
    setLocalPosition(value);
    return;
  }
  const Vector3 offset = _parent->rotation().inverse().rotate(value - _parent->position());
  const Vector3 scale = _parent->lossyScale();
  setLocalPosition(Vector3(scale.x != 0 ? offset.x / scale.x : 0,
                           scale.y != 0 ? offset.y / scale.y : 0,
                           scale.z != 0 ? offset.z / scale.z : 0));
}

void GameObject::setRotation(const Quaternion& value) {
  setLocalRotation(_parent ? _parent->rotation().inverse() * value : value);
}

}  // namespace editor
}  // namespace scenelink
