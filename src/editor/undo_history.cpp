#include "editor/undo_history.h"

#include <utility>

#include "util/log.h"

namespace scenelink {
namespace editor {

namespace {

// Object present in the scene after redo, absent after undo.
class ObjectLifetimeRecord : public UndoRecord {
 public:
  ObjectLifetimeRecord(const std::string& name, GameObject* object, GameObject* parent,
                       size_t index, bool created)
    : UndoRecord(name), _object(object), _parent(parent), _index(index), _created(created) {}

  void undo(Scene& scene) override {
    if (_created) {
      remove(scene);
    } else {
      restore(scene);
    }
  }

  void redo(Scene& scene) override {
    if (_created) {
      restore(scene);
    } else {
      remove(scene);
    }
  }

  void take(std::unique_ptr<GameObject> owned) { _owned = std::move(owned); }

 private:
  void remove(Scene& scene) {
    _owned = scene.detach(_object, &_parent, &_index);
  }

  void restore(Scene& scene) {
    if (_owned) {
      scene.attach(std::move(_owned), _parent, _index);
    }
  }

  GameObject* _object;
  GameObject* _parent;
  size_t _index;
  bool _created;
  std::unique_ptr<GameObject> _owned;
};

class ComponentStateRecord : public UndoRecord {
 public:
  ComponentStateRecord(const std::string& name, Component& component)
    : UndoRecord(name), _component(&component), _state(component.captureState()) {}

  void undo(Scene& scene) override { swap(scene); }
  void redo(Scene& scene) override { swap(scene); }

 private:
  void swap(Scene& scene) {
    _component->swapState(_state);
    scene.markDirty();
  }

  Component* _component;
  Component::State _state;
};

class GameObjectStateRecord : public UndoRecord {
 public:
  GameObjectStateRecord(const std::string& name, GameObject& object)
    : UndoRecord(name), _object(&object), _name(object.name()), _active(object.activeSelf()) {}

  void undo(Scene& scene) override { swap(scene); }
  void redo(Scene& scene) override { swap(scene); }

 private:
  void swap(Scene& scene) {
    const std::string name = _object->name();
    const bool active = _object->activeSelf();
    _object->setName(_name);
    _object->setActive(_active);
    _name = name;
    _active = active;
    scene.markDirty();
  }

  GameObject* _object;
  std::string _name;
  bool _active;
};

class ComponentLifetimeRecord : public UndoRecord {
 public:
  ComponentLifetimeRecord(const std::string& name, GameObject* owner, Component* component,
                          size_t index, bool added)
    : UndoRecord(name), _owner(owner), _component(component), _index(index), _added(added) {}

  void undo(Scene& scene) override {
    if (_added) {
      remove(scene);
    } else {
      restore(scene);
    }
  }

  void redo(Scene& scene) override {
    if (_added) {
      restore(scene);
    } else {
      remove(scene);
    }
  }

  void take(std::unique_ptr<Component> owned) { _owned = std::move(owned); }

 private:
  void remove(Scene& scene) {
    _owned = _owner->removeComponent(_component, &_index);
    scene.markDirty();
  }

  void restore(Scene& scene) {
    if (_owned) {
      _owner->insertComponent(std::move(_owned), _index);
      scene.markDirty();
    }
  }

  GameObject* _owner;
  Component* _component;
  size_t _index;
  bool _added;
  std::unique_ptr<Component> _owned;
};

class ReparentRecord : public UndoRecord {
 public:
  ReparentRecord(const std::string& name, GameObject* object, GameObject* old_parent,
                 size_t old_index, GameObject* new_parent, size_t new_index)
    : UndoRecord(name)
    , _object(object)
    , _old_parent(old_parent)
    , _old_index(old_index)
    , _new_parent(new_parent)
    , _new_index(new_index) {}

  void undo(Scene& scene) override { move(scene, _old_parent, _old_index); }
  void redo(Scene& scene) override { move(scene, _new_parent, _new_index); }

 private:
  void move(Scene& scene, GameObject* parent, size_t index) {
    std::unique_ptr<GameObject> owned = scene.detach(_object, nullptr, nullptr);
    if (owned) {
      scene.attach(std::move(owned), parent, index);
    }
  }

  GameObject* _object;
  GameObject* _old_parent;
  size_t _old_index;
  GameObject* _new_parent;
  size_t _new_index;
};

}  // namespace

UndoHistory::UndoHistory(size_t capacity) : _capacity(capacity == 0 ? 1 : capacity) {}

void UndoHistory::push(std::unique_ptr<UndoRecord> record) {
  log::get()->debug("undo: record '{}'", record->name());
  _redo.clear();
  _undo.push_back(std::move(record));
  while (_undo.size() > _capacity) {
    _undo.pop_front();
  }
}

bool UndoHistory::undo(Scene& scene) {
  if (_undo.empty()) {
    return false;
  }
  std::unique_ptr<UndoRecord> record = std::move(_undo.back());
  _undo.pop_back();
  record->undo(scene);
  log::get()->debug("undo: reverted '{}'", record->name());
  _redo.push_back(std::move(record));
  return true;
}

bool UndoHistory::redo(Scene& scene) {
  if (_redo.empty()) {
    return false;
  }
  std::unique_ptr<UndoRecord> record = std::move(_redo.back());
  _redo.pop_back();
  record->redo(scene);
  log::get()->debug("undo: reapplied '{}'", record->name());
  _undo.push_back(std::move(record));
  return true;
}

void UndoHistory::clear() {
  _redo.clear();
  _undo.clear();
}

std::string UndoHistory::currentName() const {
  return _undo.empty() ? std::string() : _undo.back()->name();
}

void UndoHistory::registerCreatedObject(GameObject& object, const std::string& name) {
  GameObject* parent = object.parent();
  const size_t index = parent ? parent->indexOfChild(&object) : 0;
  push(std::unique_ptr<UndoRecord>(new ObjectLifetimeRecord(name, &object, parent, index, true)));
}

void UndoHistory::destroyObjectImmediate(Scene& scene, GameObject& object, const std::string& name) {
  GameObject* parent = nullptr;
  size_t index = 0;
  std::unique_ptr<GameObject> owned = scene.detach(&object, &parent, &index);
  if (!owned) {
    return;
  }
  std::unique_ptr<ObjectLifetimeRecord> record(
      new ObjectLifetimeRecord(name, &object, parent, index, false));
  record->take(std::move(owned));
  push(std::move(record));
}

void UndoHistory::recordComponent(Component& component, const std::string& name) {
  push(std::unique_ptr<UndoRecord>(new ComponentStateRecord(name, component)));
}

void UndoHistory::recordGameObject(GameObject& object, const std::string& name) {
  push(std::unique_ptr<UndoRecord>(new GameObjectStateRecord(name, object)));
}

void UndoHistory::registerAddedComponent(Component& component, const std::string& name) {
  GameObject* owner = component.gameObject();
  const size_t index = owner->indexOfComponent(&component);
  push(std::unique_ptr<UndoRecord>(
      new ComponentLifetimeRecord(name, owner, &component, index, true)));
}

void UndoHistory::destroyComponentImmediate(Component& component, const std::string& name) {
  GameObject* owner = component.gameObject();
  if (!owner) {
    return;
  }
  size_t index = 0;
  std::unique_ptr<Component> owned = owner->removeComponent(&component, &index);
  if (!owned) {
    return;
  }
  std::unique_ptr<ComponentLifetimeRecord> record(
      new ComponentLifetimeRecord(name, owner, &component, index, false));
  record->take(std::move(owned));
  push(std::move(record));
}

void UndoHistory::setTransformParent(Scene& scene, GameObject& object, GameObject* new_parent,
                                     const std::string& name) {
  GameObject* old_parent = nullptr;
  size_t old_index = 0;
  std::unique_ptr<GameObject> owned = scene.detach(&object, &old_parent, &old_index);
  if (!owned) {
    return;
  }
  const size_t new_index = new_parent ? new_parent->childCount() : scene.rootCount();
  scene.attach(std::move(owned), new_parent, new_index);
  push(std::unique_ptr<UndoRecord>(
      new ReparentRecord(name, &object, old_parent, old_index, new_parent, new_index)));
}

}  // namespace editor
}  // namespace scenelink
