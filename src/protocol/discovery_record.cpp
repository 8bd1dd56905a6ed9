#include "protocol/discovery_record.h"

#include <errno.h>

#include <memory>

#include <json/json.h>

#include "protocol/bridge_message.h"
#include "protocol/bridge_protocol.h"
#include "util/file_utils.h"

namespace rpc {

const char* toString(DiscoveryError error) {
  switch (error) {
    case DiscoveryError::NOT_FOUND:  return "not found";
    case DiscoveryError::UNREADABLE: return "unreadable";
    case DiscoveryError::MALFORMED:  return "malformed";
  }
  return "unknown";
}

std::string discoveryPath(const std::string& project_root) {
  return scenelink::util::joinPath(project_root, DISCOVERY_RELATIVE_PATH);
}

std::string serializeDiscoveryRecord(const DiscoveryRecord& record) {
  Json::Value root(Json::objectValue);
  root["port"] = record.port;
  root["pid"] = record.pid;
  root["version"] = record.version;
  if (!record.channel.empty()) {
    root["channel"] = record.channel;
  }
  root["timestamp"] = static_cast<Json::Int64>(record.timestamp);
  return toJsonText(root);
}

namespace {

// Fractional seconds truncate. A negative value or one outside the int64
// range reads as 0, which is always stale.
int64_t timestampSeconds(const Json::Value& value) {
  if (value.isInt64()) {
    return value.asInt64() > 0 ? value.asInt64() : 0;
  }
  if (value.isDouble() && value.asDouble() > 0.0 && value.asDouble() < 9.2e18) {
    return static_cast<int64_t>(value.asDouble());
  }
  return 0;
}

}  // namespace

etl::expected<DiscoveryRecord, DiscoveryError> parseDiscoveryRecord(const std::string& text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors) ||
      !root.isObject()) {
    return etl::unexpected<DiscoveryError>(DiscoveryError::MALFORMED);
  }

  const Json::Value& port = root["port"];
  const Json::Value& version = root["version"];
  if (!port.isInt() || !version.isString() || version.asString().empty()) {
    return etl::unexpected<DiscoveryError>(DiscoveryError::MALFORMED);
  }
  const int port_value = port.asInt();
  if (port_value <= 0 || port_value > 65535) {
    return etl::unexpected<DiscoveryError>(DiscoveryError::MALFORMED);
  }

  DiscoveryRecord record;
  record.port = static_cast<uint16_t>(port_value);
  record.version = version.asString();
  const Json::Value& pid = root["pid"];
  record.pid = pid.isInt() ? pid.asInt() : 0;
  const Json::Value& channel = root["channel"];
  record.channel = channel.isString() ? channel.asString() : std::string();
  record.timestamp = timestampSeconds(root["timestamp"]);
  return record;
}

etl::expected<DiscoveryRecord, DiscoveryError> readDiscoveryRecord(const std::string& path) {
  if (!scenelink::util::fileExists(path)) {
    return etl::unexpected<DiscoveryError>(DiscoveryError::NOT_FOUND);
  }
  std::string text;
  if (!scenelink::util::readFile(path, text)) {
    return etl::unexpected<DiscoveryError>(DiscoveryError::UNREADABLE);
  }
  return parseDiscoveryRecord(text);
}

bool writeDiscoveryRecord(const std::string& path, const DiscoveryRecord& record) {
  return scenelink::util::writeFileAtomic(path, serializeDiscoveryRecord(record));
}

bool removeDiscoveryRecord(const std::string& path) {
  if (scenelink::util::removeFile(path)) {
    return true;
  }
  // Already gone counts as removed; the other side may have won the race.
  return errno == ENOENT;
}

}  // namespace rpc
