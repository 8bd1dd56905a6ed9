/**
 * @file ws_frame.h
 * @brief WebSocket (RFC 6455) frame builder and incremental parser.
 *
 * The parser is fed raw socket bytes and yields complete frames. Fragmented
 * data messages are reassembled before they are returned, so callers only
 * see whole text/binary messages plus the control frames (close/ping/pong)
 * that may be interleaved with them.
 */
#ifndef RPC_WS_FRAME_H
#define RPC_WS_FRAME_H

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "config/scenelink_config.h"

namespace rpc {
namespace ws {

enum class Opcode : uint8_t {
  CONTINUATION = 0x0,
  TEXT = 0x1,
  BINARY = 0x2,
  CLOSE = 0x8,
  PING = 0x9,
  PONG = 0xA
};

constexpr uint8_t kFinBit = 0x80;
constexpr uint8_t kMaskBit = 0x80;
constexpr uint8_t kReservedBits = 0x70;
constexpr uint8_t kOpcodeMask = 0x0F;
constexpr uint8_t kLength16 = 126;
constexpr uint8_t kLength64 = 127;
constexpr size_t kMaxControlPayload = 125;

inline bool isControl(Opcode op) {
  return (static_cast<uint8_t>(op) & 0x08) != 0;
}

struct Frame {
  bool fin;
  Opcode opcode;
  std::string payload;

  Frame() : fin(true), opcode(Opcode::TEXT) {}
};

enum class FrameError : uint8_t {
  NONE = 0,
  RESERVED_BITS,
  UNKNOWN_OPCODE,
  BAD_CONTROL_FRAME,
  OVERSIZED,
  UNEXPECTED_CONTINUATION
};

const char* toString(FrameError error);

class FrameBuilder {
 public:
  // Client-to-server frames must be masked; server frames must not be.
  static std::string build(Opcode opcode, const std::string& payload, bool masked);
  static std::string buildText(const std::string& payload, bool masked) {
    return build(Opcode::TEXT, payload, masked);
  }
  static std::string buildClose(uint16_t code, bool masked);
};

class FrameParser {
 public:
  explicit FrameParser(size_t max_payload = scenelink::config::kMaxMessageBytes);

  void feed(const char* data, size_t length);

  // Pops the next complete frame. Returns false when more bytes are needed
  // or when the stream is broken (see error()).
  bool next(Frame& out);

  FrameError error() const { return _error; }
  bool hasError() const { return _error != FrameError::NONE; }
  void reset();

 private:
  bool parseOne(Frame& out);

  std::string _buffer;
  size_t _max_payload;
  FrameError _error;
  bool _assembling;
  Opcode _assembly_opcode;
  std::string _assembly;
};

// Payload of a close frame: two-byte code, optional reason.
uint16_t closeCode(const std::string& close_payload);

}  // namespace ws
}  // namespace rpc

#endif  // RPC_WS_FRAME_H
