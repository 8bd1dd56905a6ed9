/**
 * @file bridge_protocol.h
 * @brief Wire-level constants shared by the Controller and the Agent.
 *
 * Changing any string here changes the on-wire format; both halves must be
 * rebuilt together. Protocol skew is tolerated (warning only) as long as the
 * peer's version is in the supported set.
 */
#ifndef RPC_BRIDGE_PROTOCOL_H
#define RPC_BRIDGE_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <string>

namespace rpc {

constexpr const char* PROTOCOL_VERSION = "1.0";
constexpr const char* const SUPPORTED_PROTOCOL_VERSIONS[] = {"1.0", "1.1"};
constexpr size_t SUPPORTED_PROTOCOL_VERSION_COUNT =
    sizeof(SUPPORTED_PROTOCOL_VERSIONS) / sizeof(SUPPORTED_PROTOCOL_VERSIONS[0]);

// Version of the Agent artifact, compared during plugin provisioning.
constexpr const char* AGENT_VERSION = "1.2.0";

// Project-relative discovery record location.
constexpr const char* DISCOVERY_RELATIVE_PATH = "Library/SceneLink/bridge.json";

constexpr const char* LOOPBACK_HOST = "127.0.0.1";

// --- Message type tags ---
constexpr const char* RPC_TYPE_REQUEST = "request";
constexpr const char* RPC_TYPE_RESPONSE = "response";
constexpr const char* RPC_TYPE_EVENT = "event";

// --- Event names ---
constexpr const char* RPC_EVENT_CONSOLE_LOG = "console.log";
constexpr const char* RPC_EVENT_PLAY_MODE_CHANGED = "playModeChanged";

// --- Error texts produced on the Controller side ---
constexpr const char* RPC_ERROR_CONNECTION_CLOSED = "Connection closed";
constexpr const char* RPC_ERROR_DISCONNECTED_BY_USER = "Disconnected by user";
constexpr const char* RPC_ERROR_TIMEOUT_PREFIX = "Command timeout: ";
constexpr const char* RPC_ERROR_UNKNOWN_COMMAND_PREFIX = "Unknown command: ";

// Id used in failed responses when the request id could not be recovered.
constexpr const char* RPC_UNKNOWN_ID = "unknown";

// WebSocket close code for a normal, user-initiated shutdown.
constexpr uint16_t RPC_CLOSE_NORMAL = 1000;

inline bool isSupportedProtocolVersion(const std::string& version) {
  for (size_t i = 0; i < SUPPORTED_PROTOCOL_VERSION_COUNT; ++i) {
    if (version == SUPPORTED_PROTOCOL_VERSIONS[i]) {
      return true;
    }
  }
  return false;
}

enum class LogType : uint8_t {
  LOG = 0,
  WARNING = 1,
  ERROR = 2,
  EXCEPTION = 3,
  ASSERT = 4
};

inline const char* toString(LogType type) {
  switch (type) {
    case LogType::WARNING:   return "Warning";
    case LogType::ERROR:     return "Error";
    case LogType::EXCEPTION: return "Exception";
    case LogType::ASSERT:    return "Assert";
    case LogType::LOG:
    default:                 return "Log";
  }
}

inline LogType parseLogType(const std::string& text) {
  if (text == "Warning") return LogType::WARNING;
  if (text == "Error") return LogType::ERROR;
  if (text == "Exception") return LogType::EXCEPTION;
  if (text == "Assert") return LogType::ASSERT;
  return LogType::LOG;
}

enum class PlayModeState : uint8_t {
  STOPPED = 0,
  PLAYING = 1,
  PAUSED = 2
};

inline const char* toString(PlayModeState state) {
  switch (state) {
    case PlayModeState::PLAYING: return "playing";
    case PlayModeState::PAUSED:  return "paused";
    case PlayModeState::STOPPED:
    default:                     return "stopped";
  }
}

inline bool parsePlayModeState(const std::string& text, PlayModeState& out) {
  if (text == "playing") {
    out = PlayModeState::PLAYING;
  } else if (text == "paused") {
    out = PlayModeState::PAUSED;
  } else if (text == "stopped") {
    out = PlayModeState::STOPPED;
  } else {
    return false;
  }
  return true;
}

}  // namespace rpc

#endif  // RPC_BRIDGE_PROTOCOL_H
