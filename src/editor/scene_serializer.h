#ifndef SCENELINK_EDITOR_SCENE_SERIALIZER_H
#define SCENELINK_EDITOR_SCENE_SERIALIZER_H

#include <stdint.h>

#include <functional>
#include <memory>

#include <json/json.h>

#include "editor/component.h"
#include "editor/game_object.h"
#include "editor/scene.h"

namespace scenelink {
namespace editor {

typedef std::function<int32_t()> InstanceIdAllocator;

/**
 * Object form:
 *   {"name": "...", "active": true,
 *    "components": [{"type": "Engine.Transform", "enabled": true,
 *                    "properties": {"m_LocalPosition": [0, 1, 0], ...}}],
 *    "children": [...]}
 */
Json::Value serializeGameObject(const GameObject& object);

// Rebuilds an object tree with fresh instance ids. Unknown component types
// and properties that do not match their declared kind are skipped with a
// warning. Returns null when the root is not an object.
std::unique_ptr<GameObject> deserializeGameObject(const Json::Value& json,
                                                  const ComponentRegistry& registry,
                                                  const InstanceIdAllocator& next_id);

// {"name": "...", "roots": [...]}
Json::Value serializeScene(const Scene& scene);

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_SCENE_SERIALIZER_H
