#ifndef SCENELINK_EDITOR_UNDO_HISTORY_H
#define SCENELINK_EDITOR_UNDO_HISTORY_H

#include <stddef.h>

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "editor/scene.h"

namespace scenelink {
namespace editor {

class UndoRecord {
 public:
  explicit UndoRecord(const std::string& name) : _name(name) {}
  virtual ~UndoRecord() {}

  const std::string& name() const { return _name; }

  virtual void undo(Scene& scene) = 0;
  virtual void redo(Scene& scene) = 0;

 private:
  std::string _name;
};

/**
 * @brief Linear undo/redo stack over the active scene.
 *
 * Every mutation goes through one of the record/register helpers below
 * before (or, for creation, right after) the change is made. Records keep
 * raw pointers to live objects; objects removed from the scene are owned by
 * the record that removed them, so pointers stay valid as long as the
 * history is unwound in stack order. Pushing a new record drops the redo
 * stack; the oldest records are dropped past the capacity.
 */
class UndoHistory {
 public:
  explicit UndoHistory(size_t capacity = 256);

  void push(std::unique_ptr<UndoRecord> record);
  bool undo(Scene& scene);
  bool redo(Scene& scene);
  void clear();

  size_t undoCount() const { return _undo.size(); }
  size_t redoCount() const { return _redo.size(); }
  // Name of the record the next undo() would revert, or "".
  std::string currentName() const;

  // Object was just created and attached to the scene.
  void registerCreatedObject(GameObject& object, const std::string& name);
  // Detaches the object and keeps it for undo.
  void destroyObjectImmediate(Scene& scene, GameObject& object, const std::string& name);
  // Snapshot taken before the caller mutates the component.
  void recordComponent(Component& component, const std::string& name);
  // Snapshot of name and active flag taken before the caller mutates them.
  void recordGameObject(GameObject& object, const std::string& name);
  // Component was just added to its GameObject.
  void registerAddedComponent(Component& component, const std::string& name);
  // Detaches the component and keeps it for undo.
  void destroyComponentImmediate(Component& component, const std::string& name);
  // Moves the object under new_parent (nullptr = root), appended last.
  void setTransformParent(Scene& scene, GameObject& object, GameObject* new_parent,
                          const std::string& name);

 private:
  size_t _capacity;
  std::deque<std::unique_ptr<UndoRecord>> _undo;
  std::vector<std::unique_ptr<UndoRecord>> _redo;
};

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_UNDO_HISTORY_H
