#ifndef RPC_BRIDGE_MESSAGE_H
#define RPC_BRIDGE_MESSAGE_H

#include <stdint.h>

#include <map>
#include <string>

#include <json/json.h>

#include "etl/expected.h"
#include "protocol/bridge_protocol.h"

namespace rpc {

// Flat parameter map. Every value travels as text; handlers coerce it.
typedef std::map<std::string, std::string> ParamMap;

enum class MessageType : uint8_t {
  REQUEST = 0,
  RESPONSE = 1,
  EVENT = 2
};

struct Request {
  std::string id;
  std::string category;
  std::string action;
  ParamMap params;

  // "category.action", the dispatch key.
  std::string key() const { return category + "." + action; }
};

struct Response {
  std::string id;
  bool success;
  Json::Value result;
  std::string error;

  Response() : success(false), result(Json::objectValue) {}

  static Response ok(const std::string& id, const Json::Value& result);
  static Response failure(const std::string& id, const std::string& error);
};

struct Event {
  std::string id;
  std::string name;
  Json::Value data;

  Event() : data(Json::objectValue) {}
};

// Tagged union of the three envelopes; only the member named by `type` is
// meaningful.
struct Message {
  MessageType type;
  Request request;
  Response response;
  Event event;

  Message() : type(MessageType::REQUEST) {}
  explicit Message(const Request& r) : type(MessageType::REQUEST), request(r) {}
  explicit Message(const Response& r) : type(MessageType::RESPONSE), response(r) {}
  explicit Message(const Event& e) : type(MessageType::EVENT), event(e) {}
};

enum class MessageError : uint8_t {
  INVALID_JSON,
  NOT_AN_OBJECT,
  MISSING_ID,
  MISSING_TYPE,
  UNKNOWN_TYPE,
  MISSING_FIELD
};

const char* toString(MessageError error);

/**
 * @brief Decode one wire message.
 *
 * Optional fields fall back to explicit defaults (params -> {}, result -> {},
 * data -> {}). Request params that are not strings are converted to their
 * textual form so handlers always see a flat string map.
 */
etl::expected<Message, MessageError> decodeMessage(const std::string& text);

// Best-effort id recovery for messages that failed to decode.
std::string peekMessageId(const std::string& text);

std::string encodeMessage(const Message& message);
std::string encode(const Request& request);
std::string encode(const Response& response);
std::string encode(const Event& event);

// Compact single-line JSON.
std::string toJsonText(const Json::Value& value);

// Random UUID-v4 string.
std::string generateMessageId();

// --- Typed event payloads ---

struct ConsoleLogEvent {
  std::string message;
  std::string stack_trace;
  LogType log_type;
  int64_t timestamp_ms;

  ConsoleLogEvent() : log_type(LogType::LOG), timestamp_ms(0) {}
};

Event makeConsoleLogEvent(const ConsoleLogEvent& entry);
bool parseConsoleLogEvent(const Json::Value& data, ConsoleLogEvent& out);

Event makePlayModeChangedEvent(PlayModeState state);
bool parsePlayModeChangedEvent(const Json::Value& data, PlayModeState& out);

}  // namespace rpc

#endif  // RPC_BRIDGE_MESSAGE_H
