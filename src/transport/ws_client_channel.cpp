/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "transport/ws_client_channel.h"

#include "protocol/bridge_protocol.h"
#include "protocol/ws_handshake.h"
#include "util/log.h"

namespace scenelink {
namespace transport {

WsClientChannel::WsClientChannel()
    : _phase(PHASE_IDLE),
      _status(ChannelStatus::IDLE),
      _port(0),
      _close_sent(false) {}

WsClientChannel::~WsClientChannel() {
  _socket.close();
}

bool WsClientChannel::open(uint16_t port, const std::string& path) {
  if (_phase != PHASE_IDLE) {
    return false;
  }
  _port = port;
  _path = path;
  _socket = Socket::connectLoopback(port);
  if (!_socket.valid()) {
    _phase = PHASE_CLOSED;
    _status = ChannelStatus::CLOSED;
    return false;
  }
  _phase = PHASE_TCP_CONNECTING;
  _status = ChannelStatus::CONNECTING;
  return true;
}

void WsClientChannel::poll(std::vector<std::string>& messages) {
  switch (_phase) {
    case PHASE_TCP_CONNECTING:
      _pollConnect();
      break;
    case PHASE_HANDSHAKING:
      _pollHandshake();
      break;
    case PHASE_OPEN:
      _pollFrames(messages);
      break;
    case PHASE_IDLE:
    case PHASE_CLOSED:
      break;
  }
}

void WsClientChannel::_pollConnect() {
  if (!_socket.waitWritable(0)) {
    return;
  }
  if (!_socket.connectSucceeded()) {
    _fail("connect refused");
    return;
  }
  _client_key = rpc::ws::generateClientKey();
  _outbox = rpc::ws::buildUpgradeRequest(rpc::LOOPBACK_HOST, _port, _path, _client_key);
  _phase = PHASE_HANDSHAKING;
  if (!_flushOutbox()) {
    _fail("upgrade request failed");
  }
}

void WsClientChannel::_pollHandshake() {
  if (!_flushOutbox()) {
    _fail("upgrade request failed");
    return;
  }
  if (!_readAvailable(_inbox)) {
    _fail("closed during upgrade");
    return;
  }
  const size_t header_end = rpc::ws::findHeaderEnd(_inbox);
  if (header_end == 0) {
    if (_inbox.size() > rpc::ws::kMaxHeaderBytes) {
      _fail("oversized upgrade response");
    }
    return;
  }
  rpc::ws::HttpResponse response;
  if (!rpc::ws::parseResponseHead(_inbox.substr(0, header_end), response)) {
    _fail("malformed upgrade response");
    return;
  }
  if (!rpc::ws::validateUpgradeResponse(response, _client_key)) {
    log::get()->warn("upgrade rejected by agent (HTTP {})", response.status);
    _fail("upgrade rejected");
    return;
  }
  const std::string rest = _inbox.substr(header_end);
  _inbox.clear();
  _parser.reset();
  if (!rest.empty()) {
    _parser.feed(rest.data(), rest.size());
  }
  _phase = PHASE_OPEN;
  _status = ChannelStatus::OPEN;
}

void WsClientChannel::_pollFrames(std::vector<std::string>& messages) {
  std::string incoming;
  const bool alive = _readAvailable(incoming);
  if (!incoming.empty()) {
    _parser.feed(incoming.data(), incoming.size());
  }

  rpc::ws::Frame frame;
  while (_phase == PHASE_OPEN && _parser.next(frame)) {
    switch (frame.opcode) {
      case rpc::ws::Opcode::TEXT:
      case rpc::ws::Opcode::BINARY:
        messages.push_back(frame.payload);
        break;
      case rpc::ws::Opcode::PING:
        _outbox += rpc::ws::FrameBuilder::build(rpc::ws::Opcode::PONG, frame.payload, true);
        break;
      case rpc::ws::Opcode::CLOSE:
        if (!_close_sent) {
          _outbox += rpc::ws::FrameBuilder::buildClose(rpc::ws::closeCode(frame.payload), true);
          _close_sent = true;
        }
        (void)_flushOutbox();
        _fail("closed by agent");
        return;
      case rpc::ws::Opcode::PONG:
      case rpc::ws::Opcode::CONTINUATION:
        break;
    }
  }
  if (_parser.hasError()) {
    log::get()->warn("websocket stream error: {}", rpc::ws::toString(_parser.error()));
    close(1002);
    return;
  }
  if (!_flushOutbox() || !alive) {
    _fail("connection lost");
  }
}

bool WsClientChannel::_readAvailable(std::string& into) {
  while (_socket.waitReadable(0)) {
    const IoResult result = _socket.receive(into);
    if (result == IoResult::WOULD_BLOCK) {
      return true;
    }
    if (result != IoResult::OK) {
      return false;
    }
  }
  return true;
}

bool WsClientChannel::_flushOutbox() {
  while (!_outbox.empty()) {
    size_t sent = 0;
    const IoResult result = _socket.sendSome(_outbox.data(), _outbox.size(), sent);
    if (result == IoResult::WOULD_BLOCK) {
      return true;
    }
    if (result != IoResult::OK) {
      return false;
    }
    _outbox.erase(0, sent);
  }
  return true;
}

bool WsClientChannel::sendText(const std::string& text) {
  if (_phase != PHASE_OPEN) {
    return false;
  }
  _outbox += rpc::ws::FrameBuilder::buildText(text, true);
  if (!_flushOutbox()) {
    _fail("send failed");
    return false;
  }
  return true;
}

void WsClientChannel::close(uint16_t code) {
  if (_phase == PHASE_OPEN && !_close_sent) {
    _outbox += rpc::ws::FrameBuilder::buildClose(code, true);
    _close_sent = true;
    (void)_flushOutbox();
  }
  _socket.shutdownBoth();
  _socket.close();
  _phase = PHASE_CLOSED;
  _status = ChannelStatus::CLOSED;
}

void WsClientChannel::_fail(const char* reason) {
  log::get()->debug("channel to port {} closed: {}", _port, reason);
  _socket.close();
  _phase = PHASE_CLOSED;
  _status = ChannelStatus::CLOSED;
}

}  // namespace transport
}  // namespace scenelink
