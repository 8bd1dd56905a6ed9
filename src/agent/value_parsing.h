#ifndef SCENELINK_AGENT_VALUE_PARSING_H
#define SCENELINK_AGENT_VALUE_PARSING_H

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include <json/json.h>

#include "editor/math_types.h"
#include "editor/property.h"

namespace scenelink {
namespace agent {

// Wire values arrive as text. Every parser below accepts the whole string
// (surrounding whitespace aside) or fails without touching `out`.

bool parseInteger(const std::string& text, int64_t& out);
bool parseFloat(const std::string& text, double& out);
// true/1 and false/0, case-insensitive.
bool parseBoolean(const std::string& text, bool& out);

// "[x,y,z]", "(x,y,z)" or "x,y,z" with exactly `count` components.
bool parseFloats(const std::string& text, size_t count, float* out);
bool parseVector2(const std::string& text, editor::Vector2& out);
bool parseVector3(const std::string& text, editor::Vector3& out);
bool parseVector4(const std::string& text, editor::Vector4& out);
// "#RRGGBB", "#RRGGBBAA" or "r,g,b[,a]" (alpha defaults to 1).
bool parseColor(const std::string& text, editor::Color& out);

/**
 * @brief Convert wire text to a property value of the given kind.
 *
 * Enums match a name case-insensitively first, then an in-range index.
 */
bool coerceValue(const std::string& text, editor::PropertyKind kind,
                 const std::vector<std::string>& enum_names, editor::PropertyValue& out);

Json::Value toJsonArray(const editor::Vector3& value);

}  // namespace agent
}  // namespace scenelink

#endif  // SCENELINK_AGENT_VALUE_PARSING_H
