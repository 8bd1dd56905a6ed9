#include "editor/property.h"

namespace scenelink {
namespace editor {

namespace {

size_t componentCount(PropertyKind kind) {
  switch (kind) {
    case PropertyKind::VECTOR2:
      return 2;
    case PropertyKind::VECTOR3:
      return 3;
    case PropertyKind::VECTOR4:
    case PropertyKind::COLOR:
      return 4;
    default:
      return 0;
  }
}

}  // namespace

const char* toString(PropertyKind kind) {
  switch (kind) {
    case PropertyKind::INTEGER:
      return "Integer";
    case PropertyKind::FLOAT:
      return "Float";
    case PropertyKind::BOOLEAN:
      return "Boolean";
    case PropertyKind::STRING:
      return "String";
    case PropertyKind::ENUM:
      return "Enum";
    case PropertyKind::VECTOR2:
      return "Vector2";
    case PropertyKind::VECTOR3:
      return "Vector3";
    case PropertyKind::VECTOR4:
      return "Vector4";
    case PropertyKind::COLOR:
      return "Color";
  }
  return "Unknown";
}

PropertyValue PropertyValue::integer(int64_t value) {
  PropertyValue out;
  out.kind = PropertyKind::INTEGER;
  out.i = value;
  return out;
}

PropertyValue PropertyValue::real(double value) {
  PropertyValue out;
  out.kind = PropertyKind::FLOAT;
  out.f = value;
  return out;
}

PropertyValue PropertyValue::boolean(bool value) {
  PropertyValue out;
  out.kind = PropertyKind::BOOLEAN;
  out.b = value;
  return out;
}

PropertyValue PropertyValue::text(const std::string& value) {
  PropertyValue out;
  out.kind = PropertyKind::STRING;
  out.s = value;
  return out;
}

PropertyValue PropertyValue::enumIndex(int64_t index) {
  PropertyValue out;
  out.kind = PropertyKind::ENUM;
  out.i = index;
  return out;
}

PropertyValue PropertyValue::vector2(const Vector2& value) {
  PropertyValue out;
  out.kind = PropertyKind::VECTOR2;
  out.v[0] = value.x;
  out.v[1] = value.y;
  return out;
}

PropertyValue PropertyValue::vector3(const Vector3& value) {
  PropertyValue out;
  out.kind = PropertyKind::VECTOR3;
  out.v[0] = value.x;
  out.v[1] = value.y;
  out.v[2] = value.z;
  return out;
}

PropertyValue PropertyValue::vector4(const Vector4& value) {
  PropertyValue out;
  out.kind = PropertyKind::VECTOR4;
  out.v[0] = value.x;
  out.v[1] = value.y;
  out.v[2] = value.z;
  out.v[3] = value.w;
  return out;
}

PropertyValue PropertyValue::color(const Color& value) {
  PropertyValue out;
  out.kind = PropertyKind::COLOR;
  out.v[0] = value.r;
  out.v[1] = value.g;
  out.v[2] = value.b;
  out.v[3] = value.a;
  return out;
}

bool PropertyValue::operator==(const PropertyValue& other) const {
  if (kind != other.kind) {
    return false;
  }
  switch (kind) {
    case PropertyKind::INTEGER:
    case PropertyKind::ENUM:
      return i == other.i;
    case PropertyKind::FLOAT:
      return f == other.f;
    case PropertyKind::BOOLEAN:
      return b == other.b;
    case PropertyKind::STRING:
      return s == other.s;
    default:
      break;
  }
  for (size_t n = 0; n < componentCount(kind); ++n) {
    if (v[n] != other.v[n]) {
      return false;
    }
  }
  return true;
}

Json::Value toJson(const PropertyValue& value, const std::vector<std::string>& enum_names) {
  switch (value.kind) {
    case PropertyKind::INTEGER:
      return Json::Value(static_cast<Json::Int64>(value.i));
    case PropertyKind::FLOAT:
      return Json::Value(value.f);
    case PropertyKind::BOOLEAN:
      return Json::Value(value.b);
    case PropertyKind::STRING:
      return Json::Value(value.s);
    case PropertyKind::ENUM:
      if (value.i >= 0 && static_cast<size_t>(value.i) < enum_names.size()) {
        return Json::Value(enum_names[static_cast<size_t>(value.i)]);
      }
      return Json::Value(static_cast<Json::Int64>(value.i));
    default:
      break;
  }
  Json::Value out(Json::arrayValue);
  for (size_t n = 0; n < componentCount(value.kind); ++n) {
    out.append(static_cast<double>(value.v[n]));
  }
  return out;
}

bool fromJson(const Json::Value& json, PropertyKind kind,
              const std::vector<std::string>& enum_names, PropertyValue& out) {
  switch (kind) {
    case PropertyKind::INTEGER:
      if (!json.isInt64()) {
        return false;
      }
      out = PropertyValue::integer(json.asInt64());
      return true;
    case PropertyKind::FLOAT:
      if (!json.isNumeric()) {
        return false;
      }
      out = PropertyValue::real(json.asDouble());
      return true;
    case PropertyKind::BOOLEAN:
      if (!json.isBool()) {
        return false;
      }
      out = PropertyValue::boolean(json.asBool());
      return true;
    case PropertyKind::STRING:
      if (!json.isString()) {
        return false;
      }
      out = PropertyValue::text(json.asString());
      return true;
    case PropertyKind::ENUM:
      if (json.isString()) {
        for (size_t n = 0; n < enum_names.size(); ++n) {
          if (enum_names[n] == json.asString()) {
            out = PropertyValue::enumIndex(static_cast<int64_t>(n));
            return true;
          }
        }
        return false;
      }
      if (!json.isInt64()) {
        return false;
      }
      out = PropertyValue::enumIndex(json.asInt64());
      return true;
    default:
      break;
  }

  const size_t count = componentCount(kind);
  if (!json.isArray() || json.size() != count) {
    return false;
  }
  PropertyValue parsed;
  parsed.kind = kind;
  for (Json::ArrayIndex n = 0; n < count; ++n) {
    if (!json[n].isNumeric()) {
      return false;
    }
    parsed.v[n] = static_cast<float>(json[n].asDouble());
  }
  out = parsed;
  return true;
}

}  // namespace editor
}  // namespace scenelink
