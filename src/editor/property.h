#ifndef SCENELINK_EDITOR_PROPERTY_H
#define SCENELINK_EDITOR_PROPERTY_H

#include <stdint.h>

#include <string>
#include <vector>

#include <json/json.h>

#include "editor/math_types.h"

namespace scenelink {
namespace editor {

enum class PropertyKind : uint8_t {
  INTEGER,
  FLOAT,
  BOOLEAN,
  STRING,
  ENUM,
  VECTOR2,
  VECTOR3,
  VECTOR4,
  COLOR
};

const char* toString(PropertyKind kind);

// A single typed value. Only the fields matching `kind` are meaningful;
// vector and colour components share `v` (x,y,z,w / r,g,b,a).
struct PropertyValue {
  PropertyKind kind;
  int64_t i;
  double f;
  bool b;
  std::string s;
  float v[4];

  PropertyValue() : kind(PropertyKind::INTEGER), i(0), f(0), b(false), v{0, 0, 0, 0} {}

  static PropertyValue integer(int64_t value);
  static PropertyValue real(double value);
  static PropertyValue boolean(bool value);
  static PropertyValue text(const std::string& value);
  static PropertyValue enumIndex(int64_t index);
  static PropertyValue vector2(const Vector2& value);
  static PropertyValue vector3(const Vector3& value);
  static PropertyValue vector4(const Vector4& value);
  static PropertyValue color(const Color& value);

  Vector2 asVector2() const { return Vector2(v[0], v[1]); }
  Vector3 asVector3() const { return Vector3(v[0], v[1], v[2]); }
  Vector4 asVector4() const { return Vector4(v[0], v[1], v[2], v[3]); }
  Color asColor() const { return Color(v[0], v[1], v[2], v[3]); }
  Quaternion asQuaternion() const { return Quaternion(v[0], v[1], v[2], v[3]); }

  bool operator==(const PropertyValue& other) const;
  bool operator!=(const PropertyValue& other) const { return !(*this == other); }
};

// Named, typed field stored on a component and written to scene/prefab files.
struct SerializedProperty {
  std::string name;
  PropertyValue value;
  std::vector<std::string> enum_names;  // ENUM only

  SerializedProperty() {}
  SerializedProperty(const std::string& name_, const PropertyValue& value_)
    : name(name_), value(value_) {}
  SerializedProperty(const std::string& name_, int64_t index, const std::vector<std::string>& names)
    : name(name_), value(PropertyValue::enumIndex(index)), enum_names(names) {}
};

// Wire/file form: numbers, bools and strings map directly, enums use their
// name, vectors and colours become arrays.
Json::Value toJson(const PropertyValue& value, const std::vector<std::string>& enum_names);

// Inverse of toJson for a value of the given kind. Returns false on a type
// mismatch and leaves out untouched.
bool fromJson(const Json::Value& json, PropertyKind kind,
              const std::vector<std::string>& enum_names, PropertyValue& out);

}  // namespace editor
}  // namespace scenelink

#endif  // SCENELINK_EDITOR_PROPERTY_H
