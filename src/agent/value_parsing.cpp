#include "agent/value_parsing.h"

#include <errno.h>
#include <stdlib.h>

#include "util/string_utils.h"

namespace scenelink {
namespace agent {

namespace {

int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHexColor(const std::string& text, editor::Color& out) {
  const std::string digits = text.substr(1);
  if (digits.size() != 6 && digits.size() != 8) {
    return false;
  }
  float channels[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  for (size_t i = 0; i < digits.size() / 2; ++i) {
    const int hi = hexDigit(digits[i * 2]);
    const int lo = hexDigit(digits[i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    channels[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
  }
  out = editor::Color(channels[0], channels[1], channels[2], channels[3]);
  return true;
}

}  // namespace

bool parseInteger(const std::string& text, int64_t& out) {
  const std::string value = util::trim(text);
  if (value.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const long long parsed = ::strtoll(value.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    return false;
  }
  out = static_cast<int64_t>(parsed);
  return true;
}

bool parseFloat(const std::string& text, double& out) {
  const std::string value = util::trim(text);
  if (value.empty()) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  const double parsed = ::strtod(value.c_str(), &end);
  if (errno == ERANGE || end == nullptr || *end != '\0') {
    return false;
  }
  out = parsed;
  return true;
}

bool parseBoolean(const std::string& text, bool& out) {
  const std::string value = util::toLower(util::trim(text));
  if (value == "true" || value == "1") {
    out = true;
    return true;
  }
  if (value == "false" || value == "0") {
    out = false;
    return true;
  }
  return false;
}

bool parseFloats(const std::string& text, size_t count, float* out) {
  const std::vector<std::string> parts = util::split(util::trim(text, "[]()"), ',');
  if (parts.size() != count) {
    return false;
  }
  float parsed[4];
  for (size_t i = 0; i < count && i < 4; ++i) {
    double value = 0;
    if (!parseFloat(parts[i], value)) {
      return false;
    }
    parsed[i] = static_cast<float>(value);
  }
  for (size_t i = 0; i < count && i < 4; ++i) {
    out[i] = parsed[i];
  }
  return true;
}

bool parseVector2(const std::string& text, editor::Vector2& out) {
  float v[2];
  if (!parseFloats(text, 2, v)) {
    return false;
  }
  out = editor::Vector2(v[0], v[1]);
  return true;
}

bool parseVector3(const std::string& text, editor::Vector3& out) {
  float v[3];
  if (!parseFloats(text, 3, v)) {
    return false;
  }
  out = editor::Vector3(v[0], v[1], v[2]);
  return true;
}

bool parseVector4(const std::string& text, editor::Vector4& out) {
  float v[4];
  if (!parseFloats(text, 4, v)) {
    return false;
  }
  out = editor::Vector4(v[0], v[1], v[2], v[3]);
  return true;
}

bool parseColor(const std::string& text, editor::Color& out) {
  const std::string value = util::trim(text);
  if (!value.empty() && value[0] == '#') {
    return parseHexColor(value, out);
  }
  float v[4] = {0, 0, 0, 1.0f};
  if (!parseFloats(value, 4, v) && !parseFloats(value, 3, v)) {
    return false;
  }
  out = editor::Color(v[0], v[1], v[2], v[3]);
  return true;
}

bool coerceValue(const std::string& text, editor::PropertyKind kind,
                 const std::vector<std::string>& enum_names, editor::PropertyValue& out) {
  using editor::PropertyKind;
  using editor::PropertyValue;

  switch (kind) {
    case PropertyKind::INTEGER: {
      int64_t value = 0;
      if (!parseInteger(text, value)) return false;
      out = PropertyValue::integer(value);
      return true;
    }
    case PropertyKind::FLOAT: {
      double value = 0;
      if (!parseFloat(text, value)) return false;
      out = PropertyValue::real(value);
      return true;
    }
    case PropertyKind::BOOLEAN: {
      bool value = false;
      if (!parseBoolean(text, value)) return false;
      out = PropertyValue::boolean(value);
      return true;
    }
    case PropertyKind::STRING:
      out = PropertyValue::text(text);
      return true;
    case PropertyKind::ENUM: {
      const std::string name = util::trim(text);
      for (size_t i = 0; i < enum_names.size(); ++i) {
        if (util::equalsIgnoreCase(enum_names[i], name)) {
          out = PropertyValue::enumIndex(static_cast<int64_t>(i));
          return true;
        }
      }
      int64_t index = 0;
      if (!parseInteger(name, index) || index < 0 ||
          static_cast<size_t>(index) >= enum_names.size()) {
        return false;
      }
      out = PropertyValue::enumIndex(index);
      return true;
    }
    case PropertyKind::VECTOR2: {
      editor::Vector2 value;
      if (!parseVector2(text, value)) return false;
      out = PropertyValue::vector2(value);
      return true;
    }
    case PropertyKind::VECTOR3: {
      editor::Vector3 value;
      if (!parseVector3(text, value)) return false;
      out = PropertyValue::vector3(value);
      return true;
    }
    case PropertyKind::VECTOR4: {
      editor::Vector4 value;
      if (!parseVector4(text, value)) return false;
      out = PropertyValue::vector4(value);
      return true;
    }
    case PropertyKind::COLOR: {
      editor::Color value;
      if (!parseColor(text, value)) return false;
      out = PropertyValue::color(value);
      return true;
    }
  }
  return false;
}

Json::Value toJsonArray(const editor::Vector3& value) {
  Json::Value out(Json::arrayValue);
  out.append(static_cast<double>(value.x));
  out.append(static_cast<double>(value.y));
  out.append(static_cast<double>(value.z));
  return out;
}

}  // namespace agent
}  // namespace scenelink
