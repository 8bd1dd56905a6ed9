#include "editor/scene.h"

#include <utility>

#include "util/string_utils.h"

namespace scenelink {
namespace editor {

Scene::Scene(const std::string& name, const std::string& path)
  : _name(name), _path(path), _dirty(false)
{
}

GameObject* Scene::attach(std::unique_ptr<GameObject> object, GameObject* parent, size_t index) {
  _dirty = true;
  if (parent) {
    return parent->insertChild(std::move(object), index);
  }
  if (index > _roots.size()) {
    index = _roots.size();
  }
  GameObject* raw = object.get();
  _roots.insert(_roots.begin() + static_cast<ptrdiff_t>(index), std::move(object));
  return raw;
}

std::unique_ptr<GameObject> Scene::detach(GameObject* object, GameObject** parent_out,
                                          size_t* index_out) {
  if (!contains(object)) {
    return std::unique_ptr<GameObject>();
  }
  GameObject* parent = object->parent();
  if (parent_out) {
    *parent_out = parent;
  }
  _dirty = true;
  if (parent) {
    return parent->removeChild(object, index_out);
  }
  for (size_t i = 0; i < _roots.size(); ++i) {
    if (_roots[i].get() == object) {
      std::unique_ptr<GameObject> out = std::move(_roots[i]);
      _roots.erase(_roots.begin() + static_cast<ptrdiff_t>(i));
      if (index_out) {
        *index_out = i;
      }
      return out;
    }
  }
  return std::unique_ptr<GameObject>();
}

GameObject* Scene::find(const std::string& path) const {
  if (path.empty()) {
    return nullptr;
  }
  const std::vector<std::string> parts = util::split(path, '/');
  GameObject* current = nullptr;
  for (const auto& root : _roots) {
    if (root->name() == parts[0]) {
      current = root.get();
      break;
    }
  }
  for (size_t i = 1; current != nullptr && i < parts.size(); ++i) {
    current = current->findChild(parts[i]);
  }
  return current;
}

GameObject* Scene::findByInstanceId(int32_t instance_id) const {
  GameObject* found = nullptr;
  for (const auto& root : _roots) {
    root->visit([&found, instance_id](GameObject& go) {
      if (!found && go.instanceId() == instance_id) {
        found = &go;
      }
    });
    if (found) {
      break;
    }
  }
  return found;
}

bool Scene::contains(const GameObject* object) const {
  if (!object) {
    return false;
  }
  const GameObject* top = object;
  while (top->parent()) {
    top = top->parent();
  }
  for (const auto& root : _roots) {
    if (root.get() == top) {
      return true;
    }
  }
  return false;
}

}  // namespace editor
}  // namespace scenelink
