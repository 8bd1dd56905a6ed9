/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "protocol/bridge_message.h"

#include <stdio.h>

#include <memory>

#include <openssl/rand.h>

#include "etl/array.h"

namespace rpc {

namespace {

constexpr const char* kFieldId = "id";
constexpr const char* kFieldType = "type";
constexpr const char* kFieldCategory = "category";
constexpr const char* kFieldAction = "action";
constexpr const char* kFieldParams = "params";
constexpr const char* kFieldSuccess = "success";
constexpr const char* kFieldResult = "result";
constexpr const char* kFieldError = "error";
constexpr const char* kFieldEvent = "event";
constexpr const char* kFieldData = "data";

bool parseJson(const std::string& text, Json::Value& out) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  std::string errors;
  return reader->parse(text.data(), text.data() + text.size(), &out, &errors);
}

std::string stringField(const Json::Value& object, const char* key) {
  const Json::Value& value = object[key];
  return value.isString() ? value.asString() : std::string();
}

// Params travel as strings; primitives and arrays are flattened to the
// textual form the handlers parse ("true", "3", "[0,1,0]").
std::string paramToText(const Json::Value& value) {
  if (value.isString()) {
    return value.asString();
  }
  if (value.isBool()) {
    return value.asBool() ? "true" : "false";
  }
  if (value.isArray()) {
    std::string out = "[";
    for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
      if (i > 0) {
        out += ",";
      }
      out += paramToText(value[i]);
    }
    out += "]";
    return out;
  }
  return toJsonText(value);
}

Json::Value paramsToJson(const ParamMap& params) {
  Json::Value out(Json::objectValue);
  for (ParamMap::const_iterator it = params.begin(); it != params.end(); ++it) {
    out[it->first] = it->second;
  }
  return out;
}

Json::Value toJson(const Request& request) {
  Json::Value root(Json::objectValue);
  root[kFieldId] = request.id;
  root[kFieldType] = RPC_TYPE_REQUEST;
  root[kFieldCategory] = request.category;
  root[kFieldAction] = request.action;
  root[kFieldParams] = paramsToJson(request.params);
  return root;
}

Json::Value toJson(const Response& response) {
  Json::Value root(Json::objectValue);
  root[kFieldId] = response.id;
  root[kFieldType] = RPC_TYPE_RESPONSE;
  root[kFieldSuccess] = response.success;
  if (response.success) {
    root[kFieldResult] = response.result;
  } else {
    root[kFieldError] = response.error;
  }
  return root;
}

Json::Value toJson(const Event& event) {
  Json::Value root(Json::objectValue);
  root[kFieldId] = event.id;
  root[kFieldType] = RPC_TYPE_EVENT;
  root[kFieldEvent] = event.name;
  root[kFieldData] = event.data;
  return root;
}

}  // namespace

Response Response::ok(const std::string& id, const Json::Value& result) {
  Response response;
  response.id = id;
  response.success = true;
  response.result = result;
  return response;
}

Response Response::failure(const std::string& id, const std::string& error) {
  Response response;
  response.id = id;
  response.success = false;
  response.result = Json::Value(Json::nullValue);
  response.error = error;
  return response;
}

const char* toString(MessageError error) {
  switch (error) {
    case MessageError::INVALID_JSON:  return "invalid JSON";
    case MessageError::NOT_AN_OBJECT: return "message is not a JSON object";
    case MessageError::MISSING_ID:    return "missing id";
    case MessageError::MISSING_TYPE:  return "missing type";
    case MessageError::UNKNOWN_TYPE:  return "unknown message type";
    case MessageError::MISSING_FIELD: return "missing required field";
  }
  return "unknown error";
}

etl::expected<Message, MessageError> decodeMessage(const std::string& text) {
  Json::Value root;
  if (!parseJson(text, root)) {
    return etl::unexpected<MessageError>(MessageError::INVALID_JSON);
  }
  if (!root.isObject()) {
    return etl::unexpected<MessageError>(MessageError::NOT_AN_OBJECT);
  }
  const std::string id = stringField(root, kFieldId);
  if (id.empty()) {
    return etl::unexpected<MessageError>(MessageError::MISSING_ID);
  }
  const std::string type = stringField(root, kFieldType);
  if (type.empty()) {
    return etl::unexpected<MessageError>(MessageError::MISSING_TYPE);
  }

  if (type == RPC_TYPE_REQUEST) {
    Request request;
    request.id = id;
    request.category = stringField(root, kFieldCategory);
    request.action = stringField(root, kFieldAction);
    if (request.category.empty() || request.action.empty()) {
      return etl::unexpected<MessageError>(MessageError::MISSING_FIELD);
    }
    const Json::Value& params = root[kFieldParams];
    if (params.isObject()) {
      const Json::Value::Members names = params.getMemberNames();
      for (size_t i = 0; i < names.size(); ++i) {
        const Json::Value& value = params[names[i]];
        if (!value.isNull()) {
          request.params[names[i]] = paramToText(value);
        }
      }
    }
    return Message(request);
  }

  if (type == RPC_TYPE_RESPONSE) {
    const Json::Value& success = root[kFieldSuccess];
    if (!success.isBool()) {
      return etl::unexpected<MessageError>(MessageError::MISSING_FIELD);
    }
    Response response;
    response.id = id;
    response.success = success.asBool();
    if (response.success) {
      response.result = root.isMember(kFieldResult) ? root[kFieldResult]
                                                    : Json::Value(Json::objectValue);
    } else {
      response.result = Json::Value(Json::nullValue);
      response.error = stringField(root, kFieldError);
    }
    return Message(response);
  }

  if (type == RPC_TYPE_EVENT) {
    Event event;
    event.id = id;
    event.name = stringField(root, kFieldEvent);
    if (event.name.empty()) {
      return etl::unexpected<MessageError>(MessageError::MISSING_FIELD);
    }
    const Json::Value& data = root[kFieldData];
    event.data = data.isNull() ? Json::Value(Json::objectValue) : data;
    return Message(event);
  }

  return etl::unexpected<MessageError>(MessageError::UNKNOWN_TYPE);
}

std::string peekMessageId(const std::string& text) {
  Json::Value root;
  if (!parseJson(text, root) || !root.isObject()) {
    return std::string();
  }
  return stringField(root, kFieldId);
}

std::string encodeMessage(const Message& message) {
  switch (message.type) {
    case MessageType::REQUEST:  return encode(message.request);
    case MessageType::RESPONSE: return encode(message.response);
    case MessageType::EVENT:    return encode(message.event);
  }
  return std::string();
}

std::string encode(const Request& request) { return toJsonText(toJson(request)); }
std::string encode(const Response& response) { return toJsonText(toJson(response)); }
std::string encode(const Event& event) { return toJsonText(toJson(event)); }

std::string toJsonText(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["precision"] = 7;
  return Json::writeString(builder, value);
}

std::string generateMessageId() {
  etl::array<uint8_t, 16> bytes;
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    // RNG failure is not fatal for correlation; fall back to a counter so
    // ids stay unique within the process.
    static uint64_t fallback_counter = 0;
    ++fallback_counter;
    for (size_t i = 0; i < bytes.size(); ++i) {
      bytes[i] = static_cast<uint8_t>((fallback_counter >> ((i % 8) * 8)) ^ (i * 31));
    }
  }
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

  char text[37];
  (void)snprintf(text, sizeof(text),
                 "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                 bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                 bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                 bytes[12], bytes[13], bytes[14], bytes[15]);
  return std::string(text);
}

Event makeConsoleLogEvent(const ConsoleLogEvent& entry) {
  Event event;
  event.id = generateMessageId();
  event.name = RPC_EVENT_CONSOLE_LOG;
  event.data["message"] = entry.message;
  event.data["stackTrace"] = entry.stack_trace;
  event.data["logType"] = toString(entry.log_type);
  event.data["timestamp"] = static_cast<Json::Int64>(entry.timestamp_ms);
  return event;
}

bool parseConsoleLogEvent(const Json::Value& data, ConsoleLogEvent& out) {
  if (!data.isObject() || !data["message"].isString()) {
    return false;
  }
  out.message = data["message"].asString();
  out.stack_trace = stringField(data, "stackTrace");
  out.log_type = parseLogType(stringField(data, "logType"));
  // isInt64() also accepts whole doubles within range; anything else reads as 0.
  out.timestamp_ms = data["timestamp"].isInt64() ? data["timestamp"].asInt64() : 0;
  return true;
}

Event makePlayModeChangedEvent(PlayModeState state) {
  Event event;
  event.id = generateMessageId();
  event.name = RPC_EVENT_PLAY_MODE_CHANGED;
  event.data["state"] = toString(state);
  return event;
}

bool parsePlayModeChangedEvent(const Json::Value& data, PlayModeState& out) {
  if (!data.isObject()) {
    return false;
  }
  return parsePlayModeState(stringField(data, "state"), out);
}

}  // namespace rpc
