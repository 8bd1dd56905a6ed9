/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#ifndef SCENELINK_EDITOR_APPLICATION_H
#define SCENELINK_EDITOR_APPLICATION_H

#include <stdint.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "editor/asset_database.h"
#include "editor/component.h"
#include "editor/game_object.h"
#include "editor/scene.h"
#include "editor/undo_history.h"
#include "protocol/bridge_protocol.h"

namespace scenelink {
namespace editor {

constexpr const char* kEngineVersion = "SceneLink Editor 1.2";
constexpr const char* kDefaultSceneFolder = "Assets/Scenes";
constexpr const char* kSceneExtension = ".scene";

enum class PrimitiveType : uint8_t {
  SPHERE,
  CAPSULE,
  CYLINDER,
  CUBE,
  PLANE,
  QUAD
};

const char* toString(PrimitiveType type);
// Case-insensitive.
bool parsePrimitiveType(const std::string& text, PrimitiveType& out);

struct LogEntry {
  std::string message;
  std::string stack_trace;
  rpc::LogType type;
  int64_t timestamp_ms;
};

/**
 * @brief The editor host the Agent drives.
 *
 * Owns the active scene, the undo history, the asset index, selection,
 * play mode, the console log hook and the menu. Scene-graph methods are
 * main-thread only; log() and the listener registration calls may be used
 * from any thread.
 */
class EditorApplication {
 public:
  typedef std::function<void(const LogEntry&)> LogListener;
  typedef std::function<void(rpc::PlayModeState)> PlayModeListener;
  typedef std::function<bool()> MenuAction;

  explicit EditorApplication(const std::string& project_root);

  // --- Model ---
  Scene& activeScene() { return *_scene; }
  ComponentRegistry& components() { return _components; }
  UndoHistory& undoHistory() { return _undo; }
  AssetDatabase& assets() { return _assets; }
  const std::string& projectRoot() const { return _project_root; }
  int32_t allocateInstanceId();

  // Detached objects; callers attach them and register the undo record.
  std::unique_ptr<GameObject> createGameObject(const std::string& name);
  std::unique_ptr<GameObject> createPrimitive(PrimitiveType type, const std::string& name);
  Component* addComponent(GameObject& object, const ComponentType& type);

  // Replaces the active scene with one holding a camera and a light.
  // Clears undo history and selection.
  Scene& newScene(const std::string& name);
  // Saves to asset_path, or to the scene's own path when empty. Untitled
  // scenes go to Assets/Scenes/<name>.scene.
  bool saveScene(const std::string& asset_path);

  bool undo();
  bool redo();

  // --- Selection ---
  void select(const GameObject* object);
  void setSelection(const std::vector<int32_t>& instance_ids);
  void clearSelection() { _selection.clear(); }
  // Selected objects still present in the scene, in selection order.
  std::vector<GameObject*> selectedObjects() const;

  // --- Play mode ---
  rpc::PlayModeState playModeState() const;
  bool isPlaying() const { return _playing; }
  bool isPaused() const { return _paused; }
  void play();
  // Returns the new paused flag.
  bool togglePause();
  void stop();

  int addPlayModeListener(const PlayModeListener& listener);
  void removePlayModeListener(int token);

  // --- Console ---
  void log(rpc::LogType type, const std::string& message, const std::string& stack_trace = "");
  int addLogListener(const LogListener& listener);
  void removeLogListener(int token);

  // --- Menu ---
  void registerMenuItem(const std::string& path, const MenuAction& action);
  // False for unknown paths and for actions that report failure.
  bool executeMenuItem(const std::string& path);
  std::vector<std::string> menuItems() const;

  // --- Project ---
  std::string productName() const;
  std::string engineVersion() const { return kEngineVersion; }
  std::string platform() const;

 private:
  void _registerDefaultMenu();
  void _notifyPlayMode();

  std::string _project_root;
  ComponentRegistry _components;
  AssetDatabase _assets;
  UndoHistory _undo;
  std::unique_ptr<Scene> _scene;
  int32_t _next_instance_id;
  std::vector<int32_t> _selection;
  bool _playing;
  bool _paused;
  std::map<std::string, MenuAction> _menu;

  std::mutex _listener_mutex;
  int _next_listener_token;
  std::map<int, LogListener> _log_listeners;
  std::map<int, PlayModeListener> _play_mode_listeners;
};

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_APPLICATION_H
