/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "editor/editor_application.h"

#include <limits.h>
#include <stdlib.h>

#include <chrono>
#include <utility>

#include "editor/scene_serializer.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace scenelink {
namespace editor {

namespace {

constexpr int32_t kFirstInstanceId = 10000;

const char* const kPrimitiveNames[] = {"Sphere", "Capsule", "Cylinder", "Cube", "Plane", "Quad"};

int64_t wallClockMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace

const char* toString(PrimitiveType type) {
  return kPrimitiveNames[static_cast<uint8_t>(type)];
}

bool parsePrimitiveType(const std::string& text, PrimitiveType& out) {
  for (uint8_t i = 0; i < sizeof(kPrimitiveNames) / sizeof(kPrimitiveNames[0]); ++i) {
    if (util::equalsIgnoreCase(text, kPrimitiveNames[i])) {
      out = static_cast<PrimitiveType>(i);
      return true;
    }
  }
  return false;
}

EditorApplication::EditorApplication(const std::string& project_root)
  : _project_root(project_root)
  , _assets(project_root)
  , _next_instance_id(kFirstInstanceId)
  , _playing(false)
  , _paused(false)
  , _next_listener_token(1)
{
  newScene("Untitled");
  _scene->clearDirty();
  _registerDefaultMenu();
}

int32_t EditorApplication::allocateInstanceId() {
  return _next_instance_id++;
}

std::unique_ptr<GameObject> EditorApplication::createGameObject(const std::string& name) {
  const int32_t id = allocateInstanceId();
  return std::unique_ptr<GameObject>(new GameObject(
      name, id,
      std::unique_ptr<Component>(new Component(_components.transformType(), allocateInstanceId()))));
}

std::unique_ptr<GameObject> EditorApplication::createPrimitive(PrimitiveType type,
                                                               const std::string& name) {
  std::unique_ptr<GameObject> object = createGameObject(name);

  Component* filter = addComponent(*object, *_components.find("MeshFilter"));
  filter->set("m_Mesh", PropertyValue::text(toString(type)));
  addComponent(*object, *_components.find("MeshRenderer"));

  const char* collider = "MeshCollider";
  switch (type) {
    case PrimitiveType::SPHERE:
      collider = "SphereCollider";
      break;
    case PrimitiveType::CAPSULE:
    case PrimitiveType::CYLINDER:
      collider = "CapsuleCollider";
      break;
    case PrimitiveType::CUBE:
      collider = "BoxCollider";
      break;
    case PrimitiveType::PLANE:
    case PrimitiveType::QUAD:
      break;
  }
  Component* shape = addComponent(*object, *_components.find(collider));
  if (type == PrimitiveType::PLANE || type == PrimitiveType::QUAD) {
    shape->set("m_Mesh", PropertyValue::text(toString(type)));
  }
  return object;
}

Component* EditorApplication::addComponent(GameObject& object, const ComponentType& type) {
  return object.insertComponent(
      std::unique_ptr<Component>(new Component(type, allocateInstanceId())),
      object.components().size());
}

Scene& EditorApplication::newScene(const std::string& name) {
  _undo.clear();
  _selection.clear();
  _scene.reset(new Scene(name, ""));

  std::unique_ptr<GameObject> camera = createGameObject("Main Camera");
  camera->setLocalPosition(Vector3(0, 1, -10));
  addComponent(*camera, *_components.find("Camera"));
  addComponent(*camera, *_components.find("AudioListener"));
  _scene->attach(std::move(camera), nullptr, _scene->rootCount());

  std::unique_ptr<GameObject> light = createGameObject("Directional Light");
  light->setLocalPosition(Vector3(0, 3, 0));
  light->setLocalRotation(Quaternion::fromEuler(Vector3(50, -30, 0)));
  Component* source = addComponent(*light, *_components.find("Light"));
  source->set("m_Type", PropertyValue::enumIndex(1));
  _scene->attach(std::move(light), nullptr, _scene->rootCount());

  log::get()->info("editor: new scene '{}'", name);
  return *_scene;
}

bool EditorApplication::saveScene(const std::string& asset_path) {
  std::string path = asset_path.empty() ? _scene->path() : asset_path;
  if (path.empty()) {
    path = std::string(kDefaultSceneFolder) + "/" + _scene->name() + kSceneExtension;
  }
  if (!_assets.writeJson(path, serializeScene(*_scene))) {
    return false;
  }
  _scene->setPath(path);
  _scene->setName(util::fileStem(path));
  _scene->clearDirty();
  log::get()->info("editor: saved scene to {}", path);
  return true;
}

bool EditorApplication::undo() {
  return _undo.undo(*_scene);
}

bool EditorApplication::redo() {
  return _undo.redo(*_scene);
}

void EditorApplication::select(const GameObject* object) {
  _selection.clear();
  if (object) {
    _selection.push_back(object->instanceId());
  }
}

void EditorApplication::setSelection(const std::vector<int32_t>& instance_ids) {
  _selection = instance_ids;
}

std::vector<GameObject*> EditorApplication::selectedObjects() const {
  std::vector<GameObject*> out;
  for (int32_t id : _selection) {
    GameObject* object = _scene->findByInstanceId(id);
    if (object) {
      out.push_back(object);
    }
  }
  return out;
}

rpc::PlayModeState EditorApplication::playModeState() const {
  if (!_playing) {
    return rpc::PlayModeState::STOPPED;
  }
  return _paused ? rpc::PlayModeState::PAUSED : rpc::PlayModeState::PLAYING;
}

void EditorApplication::play() {
  if (_playing) {
    return;
  }
  _playing = true;
  _notifyPlayMode();
}

bool EditorApplication::togglePause() {
  _paused = !_paused;
  if (_playing) {
    _notifyPlayMode();
  }
  return _paused;
}

void EditorApplication::stop() {
  if (!_playing) {
    return;
  }
  _playing = false;
  _paused = false;
  _notifyPlayMode();
}

int EditorApplication::addPlayModeListener(const PlayModeListener& listener) {
  std::lock_guard<std::mutex> lock(_listener_mutex);
  const int token = _next_listener_token++;
  _play_mode_listeners[token] = listener;
  return token;
}

void EditorApplication::removePlayModeListener(int token) {
  std::lock_guard<std::mutex> lock(_listener_mutex);
  _play_mode_listeners.erase(token);
}

void EditorApplication::log(rpc::LogType type, const std::string& message,
                            const std::string& stack_trace) {
  LogEntry entry;
  entry.message = message;
  entry.stack_trace = stack_trace;
  entry.type = type;
  entry.timestamp_ms = wallClockMillis();

  std::vector<LogListener> listeners;
  {
    std::lock_guard<std::mutex> lock(_listener_mutex);
    for (const auto& item : _log_listeners) {
      listeners.push_back(item.second);
    }
  }
  for (const LogListener& listener : listeners) {
    listener(entry);
  }
}

int EditorApplication::addLogListener(const LogListener& listener) {
  std::lock_guard<std::mutex> lock(_listener_mutex);
  const int token = _next_listener_token++;
  _log_listeners[token] = listener;
  return token;
}

void EditorApplication::removeLogListener(int token) {
  std::lock_guard<std::mutex> lock(_listener_mutex);
  _log_listeners.erase(token);
}

void EditorApplication::registerMenuItem(const std::string& path, const MenuAction& action) {
  _menu[path] = action;
}

bool EditorApplication::executeMenuItem(const std::string& path) {
  auto it = _menu.find(path);
  if (it == _menu.end()) {
    log::get()->warn("editor: no menu item '{}'", path);
    return false;
  }
  return it->second();
}

std::vector<std::string> EditorApplication::menuItems() const {
  std::vector<std::string> out;
  for (const auto& item : _menu) {
    out.push_back(item.first);
  }
  return out;
}

std::string EditorApplication::productName() const {
  char resolved[PATH_MAX];
  std::string root = _project_root;
  if (::realpath(_project_root.c_str(), resolved) != nullptr) {
    root = resolved;
  }
  while (root.size() > 1 && root[root.size() - 1] == '/') {
    root.erase(root.size() - 1);
  }
  const size_t slash = root.find_last_of('/');
  return slash == std::string::npos ? root : root.substr(slash + 1);
}

std::string EditorApplication::platform() const {
#if defined(__linux__)
  return "Linux";
#elif defined(__APPLE__)
  return "macOS";
#elif defined(_WIN32)
  return "Windows";
#else
  return "Unknown";
#endif
}

void EditorApplication::_registerDefaultMenu() {
  registerMenuItem("Edit/Undo", [this]() { return undo(); });
  registerMenuItem("Edit/Redo", [this]() { return redo(); });
  registerMenuItem("Edit/Play", [this]() {
    if (_playing) {
      stop();
    } else {
      play();
    }
    return true;
  });
  registerMenuItem("Edit/Pause", [this]() {
    togglePause();
    return true;
  });
  registerMenuItem("Edit/Clear Selection", [this]() {
    clearSelection();
    return true;
  });
  registerMenuItem("File/Save", [this]() { return saveScene(""); });
  registerMenuItem("File/New Scene", [this]() {
    newScene("Untitled");
    return true;
  });
  registerMenuItem("Assets/Refresh", [this]() {
    _assets.refresh();
    return true;
  });
  registerMenuItem("GameObject/Create Empty", [this]() {
    GameObject* object = _scene->attach(createGameObject("GameObject"), nullptr, _scene->rootCount());
    _undo.registerCreatedObject(*object, "Create GameObject");
    select(object);
    return true;
  });
}

void EditorApplication::_notifyPlayMode() {
  const rpc::PlayModeState state = playModeState();
  log::get()->info("editor: play mode {}", rpc::toString(state));
  std::vector<PlayModeListener> listeners;
  {
    std::lock_guard<std::mutex> lock(_listener_mutex);
    for (const auto& item : _play_mode_listeners) {
      listeners.push_back(item.second);
    }
  }
  for (const PlayModeListener& listener : listeners) {
    listener(state);
  }
}

}  // namespace editor
}  // namespace scenelink
