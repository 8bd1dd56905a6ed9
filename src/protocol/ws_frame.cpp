#include "protocol/ws_frame.h"

#include <openssl/rand.h>

#include "etl/array.h"

namespace rpc {
namespace ws {

namespace {

bool isKnownOpcode(uint8_t raw) {
  switch (raw) {
    case 0x0: case 0x1: case 0x2: case 0x8: case 0x9: case 0xA:
      return true;
    default:
      return false;
  }
}

void appendLength(std::string& out, uint8_t mask_flag, uint64_t length) {
  if (length < kLength16) {
    out.push_back(static_cast<char>(mask_flag | static_cast<uint8_t>(length)));
  } else if (length <= 0xFFFF) {
    out.push_back(static_cast<char>(mask_flag | kLength16));
    out.push_back(static_cast<char>((length >> 8) & 0xFF));
    out.push_back(static_cast<char>(length & 0xFF));
  } else {
    out.push_back(static_cast<char>(mask_flag | kLength64));
    for (int shift = 56; shift >= 0; shift -= 8) {
      out.push_back(static_cast<char>((length >> shift) & 0xFF));
    }
  }
}

}  // namespace

const char* toString(FrameError error) {
  switch (error) {
    case FrameError::NONE:                    return "none";
    case FrameError::RESERVED_BITS:           return "reserved bits set";
    case FrameError::UNKNOWN_OPCODE:          return "unknown opcode";
    case FrameError::BAD_CONTROL_FRAME:       return "invalid control frame";
    case FrameError::OVERSIZED:               return "payload too large";
    case FrameError::UNEXPECTED_CONTINUATION: return "unexpected continuation";
  }
  return "unknown";
}

std::string FrameBuilder::build(Opcode opcode, const std::string& payload, bool masked) {
  std::string out;
  out.reserve(payload.size() + 14);
  out.push_back(static_cast<char>(kFinBit | static_cast<uint8_t>(opcode)));
  appendLength(out, masked ? kMaskBit : 0, payload.size());
  if (!masked) {
    out += payload;
    return out;
  }
  etl::array<uint8_t, 4> key;
  if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
    key.fill(0x5A);
  }
  for (size_t i = 0; i < key.size(); ++i) {
    out.push_back(static_cast<char>(key[i]));
  }
  for (size_t i = 0; i < payload.size(); ++i) {
    out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ key[i % 4]));
  }
  return out;
}

std::string FrameBuilder::buildClose(uint16_t code, bool masked) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  return build(Opcode::CLOSE, payload, masked);
}

FrameParser::FrameParser(size_t max_payload)
    : _max_payload(max_payload),
      _error(FrameError::NONE),
      _assembling(false),
      _assembly_opcode(Opcode::TEXT) {}

void FrameParser::reset() {
  _buffer.clear();
  _error = FrameError::NONE;
  _assembling = false;
  _assembly.clear();
}

void FrameParser::feed(const char* data, size_t length) {
  if (_error != FrameError::NONE) {
    return;
  }
  _buffer.append(data, length);
}

bool FrameParser::next(Frame& out) {
  while (_error == FrameError::NONE) {
    Frame frame;
    if (!parseOne(frame)) {
      return false;
    }
    if (isControl(frame.opcode)) {
      out = frame;
      return true;
    }
    if (frame.opcode == Opcode::CONTINUATION) {
      if (!_assembling) {
        _error = FrameError::UNEXPECTED_CONTINUATION;
        return false;
      }
    } else {
      if (_assembling) {
        _error = FrameError::UNEXPECTED_CONTINUATION;
        return false;
      }
      _assembly_opcode = frame.opcode;
      _assembly.clear();
    }
    if (_assembly.size() + frame.payload.size() > _max_payload) {
      _error = FrameError::OVERSIZED;
      return false;
    }
    _assembly += frame.payload;
    _assembling = !frame.fin;
    if (frame.fin) {
      out.fin = true;
      out.opcode = _assembly_opcode;
      out.payload.swap(_assembly);
      _assembly.clear();
      return true;
    }
  }
  return false;
}

bool FrameParser::parseOne(Frame& out) {
  if (_buffer.size() < 2) {
    return false;
  }
  const uint8_t b0 = static_cast<uint8_t>(_buffer[0]);
  const uint8_t b1 = static_cast<uint8_t>(_buffer[1]);
  if ((b0 & kReservedBits) != 0) {
    _error = FrameError::RESERVED_BITS;
    return false;
  }
  const uint8_t raw_opcode = b0 & kOpcodeMask;
  if (!isKnownOpcode(raw_opcode)) {
    _error = FrameError::UNKNOWN_OPCODE;
    return false;
  }
  const bool fin = (b0 & kFinBit) != 0;
  const Opcode opcode = static_cast<Opcode>(raw_opcode);
  const bool masked = (b1 & kMaskBit) != 0;

  size_t offset = 2;
  uint64_t length = b1 & 0x7F;
  if (length == kLength16) {
    if (_buffer.size() < offset + 2) {
      return false;
    }
    length = (static_cast<uint64_t>(static_cast<uint8_t>(_buffer[2])) << 8) |
             static_cast<uint8_t>(_buffer[3]);
    offset += 2;
  } else if (length == kLength64) {
    if (_buffer.size() < offset + 8) {
      return false;
    }
    length = 0;
    for (size_t i = 0; i < 8; ++i) {
      length = (length << 8) | static_cast<uint8_t>(_buffer[2 + i]);
    }
    offset += 8;
  }

  if (isControl(opcode) && (length > kMaxControlPayload || !fin)) {
    _error = FrameError::BAD_CONTROL_FRAME;
    return false;
  }
  if (length > _max_payload) {
    _error = FrameError::OVERSIZED;
    return false;
  }

  etl::array<uint8_t, 4> key;
  key.fill(0);
  if (masked) {
    if (_buffer.size() < offset + 4) {
      return false;
    }
    for (size_t i = 0; i < 4; ++i) {
      key[i] = static_cast<uint8_t>(_buffer[offset + i]);
    }
    offset += 4;
  }
  const size_t payload_length = static_cast<size_t>(length);
  if (_buffer.size() < offset + payload_length) {
    return false;
  }

  out.fin = fin;
  out.opcode = opcode;
  out.payload.assign(_buffer, offset, payload_length);
  if (masked) {
    for (size_t i = 0; i < payload_length; ++i) {
      out.payload[i] = static_cast<char>(static_cast<uint8_t>(out.payload[i]) ^ key[i % 4]);
    }
  }
  _buffer.erase(0, offset + payload_length);
  return true;
}

uint16_t closeCode(const std::string& close_payload) {
  if (close_payload.size() < 2) {
    return 0;
  }
  return static_cast<uint16_t>((static_cast<uint8_t>(close_payload[0]) << 8) |
                               static_cast<uint8_t>(close_payload[1]));
}

}  // namespace ws
}  // namespace rpc
