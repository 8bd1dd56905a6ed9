#ifndef SCENELINK_EDITOR_SCENE_H
#define SCENELINK_EDITOR_SCENE_H

#include <stddef.h>
#include <stdint.h>

#include <memory>
#include <string>
#include <vector>

#include "editor/game_object.h"

namespace scenelink {
namespace editor {

class Scene {
 public:
  Scene(const std::string& name, const std::string& path);

  const std::string& name() const { return _name; }
  void setName(const std::string& name) { _name = name; }
  // Project-relative asset path; empty until the scene is first saved.
  const std::string& path() const { return _path; }
  void setPath(const std::string& path) { _path = path; }

  bool isDirty() const { return _dirty; }
  void markDirty() { _dirty = true; }
  void clearDirty() { _dirty = false; }

  const std::vector<std::unique_ptr<GameObject>>& roots() const { return _roots; }
  size_t rootCount() const { return _roots.size(); }

  // Places an object under parent (nullptr = scene root) at index, clamped
  // to the end.
  GameObject* attach(std::unique_ptr<GameObject> object, GameObject* parent, size_t index);
  // Inverse of attach. Returns null when the object is not in this scene.
  std::unique_ptr<GameObject> detach(GameObject* object, GameObject** parent_out, size_t* index_out);

  /**
   * @brief Resolve a "Root/Child/Leaf" path.
   *
   * The first segment matches a root by name, inactive objects included;
   * each further segment matches a direct child. First match wins.
   */
  GameObject* find(const std::string& path) const;
  GameObject* findByInstanceId(int32_t instance_id) const;
  bool contains(const GameObject* object) const;

 private:
  std::string _name;
  std::string _path;
  bool _dirty;
  std::vector<std::unique_ptr<GameObject>> _roots;
};

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_SCENE_H
