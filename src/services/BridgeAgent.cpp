/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "BridgeAgent.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <chrono>
#include <sstream>
#include <utility>
#include <vector>

#include "protocol/discovery_record.h"
#include "protocol/ws_frame.h"
#include "protocol/ws_handshake.h"
#include "util/file_utils.h"
#include "util/log.h"
#include "util/string_utils.h"

namespace scenelink {

namespace {

constexpr int kAcceptPollMs = 100;
constexpr int kHandshakeReadMs = 2000;
constexpr int kListenBacklog = 4;
constexpr size_t kReceiveChunk = 64 * 1024;
// WebSocket close code for a protocol violation (RFC 6455 7.4.1).
constexpr uint16_t kCloseProtocolError = 1002;

bool parsePort(const std::string& text, uint16_t& out) {
  char* end = nullptr;
  const long value = ::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || value < 0 || value > 65535) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

bool parseCount(const std::string& text, size_t& out) {
  char* end = nullptr;
  const long value = ::strtol(text.c_str(), &end, 10);
  if (text.empty() || *end != '\0' || value <= 0) {
    return false;
  }
  out = static_cast<size_t>(value);
  return true;
}

void sleepMs(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace

bool parseAgentDescriptor(const std::string& text, AgentConfig& out) {
  AgentConfig parsed = out;
  bool in_agent = false;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = util::trim(line);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
      continue;
    }
    if (line[0] == '[') {
      in_agent = (util::trim(line, "[]") == "agent");
      continue;
    }
    if (!in_agent) {
      continue;
    }
    const size_t eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const std::string key = util::trim(line.substr(0, eq));
    const std::string value = util::trim(line.substr(eq + 1));
    if (key == "port") {
      if (!parsePort(value, parsed.port)) {
        return false;
      }
    } else if (key == "channel") {
      parsed.channel = util::trim(value, "/");
    } else if (key == "batch") {
      if (!parseCount(value, parsed.batch_size)) {
        return false;
      }
      if (parsed.batch_size > config::kInboundQueueSize) {
        parsed.batch_size = config::kInboundQueueSize;
      }
    } else if (key == "discovery") {
      if (!value.empty()) {
        parsed.discovery_relative_path = value;
      }
    }
  }
  out = parsed;
  return true;
}

BridgeAgent::BridgeAgent(const AgentConfig& config, editor::EditorApplication& editor,
                         util::Clock& clock)
    : _config(config),
      _editor(editor),
      _clock(clock),
      _dispatcher(editor),
      _discovery_path(util::joinPath(config.project_root, config.discovery_relative_path)),
      _channel_path(rpc::ws::channelPath(config.channel)),
      _port(0),
      _running(false),
      _client_connected(false),
      _last_discovery_write(0),
      _log_listener(0),
      _play_mode_listener(0),
      _client_generation(0) {}

BridgeAgent::~BridgeAgent() {
  end();
}

bool BridgeAgent::begin() {
  if (_running) {
    return true;
  }
  _listener = transport::Socket::listenLoopback(_config.port, kListenBacklog);
  if (!_listener.valid()) {
    log::get()->error("agent: cannot listen on {}:{}", rpc::LOOPBACK_HOST, _config.port);
    return false;
  }
  _port = _listener.localPort();
  _running = true;

  _accept_thread = std::thread(&BridgeAgent::_acceptLoop, this);
  _receive_thread = std::thread(&BridgeAgent::_receiveLoop, this);
  _send_thread = std::thread(&BridgeAgent::_sendLoop, this);

  _writeDiscovery();

  _log_listener = _editor.addLogListener([this](const editor::LogEntry& entry) {
    rpc::ConsoleLogEvent payload;
    payload.message = entry.message;
    payload.stack_trace = entry.stack_trace;
    payload.log_type = entry.type;
    payload.timestamp_ms = entry.timestamp_ms;
    sendEvent(rpc::makeConsoleLogEvent(payload));
  });
  _play_mode_listener = _editor.addPlayModeListener([this](rpc::PlayModeState state) {
    sendEvent(rpc::makePlayModeChangedEvent(state));
  });

  log::get()->info("agent: listening on ws://{}:{}{}", rpc::LOOPBACK_HOST, _port, _channel_path);
  return true;
}

void BridgeAgent::end() {
  if (!_running) {
    return;
  }
  _editor.removeLogListener(_log_listener);
  _editor.removePlayModeListener(_play_mode_listener);

  _running = false;
  _outbound_cv.notify_all();
  if (_accept_thread.joinable()) {
    _accept_thread.join();
  }
  if (_receive_thread.joinable()) {
    _receive_thread.join();
  }
  if (_send_thread.joinable()) {
    _send_thread.join();
  }
  _listener.close();

  uint64_t generation = 0;
  ClientPtr client = _currentClient(generation);
  if (client) {
    (void)client->sendAll(rpc::ws::FrameBuilder::buildClose(rpc::RPC_CLOSE_NORMAL, false));
    _dropClient(client, "agent shutting down");
  }

  {
    std::lock_guard<std::mutex> lock(_inbound_mutex);
    _inbound.clear();
  }
  {
    std::lock_guard<std::mutex> lock(_outbound_mutex);
    _outbound.clear();
  }
  if (!rpc::removeDiscoveryRecord(_discovery_path)) {
    log::get()->warn("agent: cannot remove {}: {}", _discovery_path, strerror(errno));
  }
  log::get()->info("agent: stopped");
}

void BridgeAgent::onBeforeReload() {
  log::get()->info("agent: domain reload, shutting down");
  end();
}

void BridgeAgent::onAfterReload() {
  if (!begin()) {
    log::get()->error("agent: restart after reload failed");
  }
}

void BridgeAgent::update() {
  if (!_running) {
    return;
  }
  for (size_t handled = 0; handled < _config.batch_size; ++handled) {
    std::string text;
    {
      std::lock_guard<std::mutex> lock(_inbound_mutex);
      if (_inbound.empty()) {
        break;
      }
      text = _inbound.front();
      _inbound.pop();
    }
    _handleInbound(text);
  }
  _refreshDiscovery();
}

size_t BridgeAgent::pendingInbound() {
  std::lock_guard<std::mutex> lock(_inbound_mutex);
  return _inbound.size();
}

size_t BridgeAgent::pendingOutbound() {
  std::lock_guard<std::mutex> lock(_outbound_mutex);
  return _outbound.size();
}

void BridgeAgent::sendEvent(const rpc::Event& event) {
  if (!_client_connected) {
    return;
  }
  _queueOutbound(rpc::ws::FrameBuilder::buildText(rpc::encode(event), false));
}

void BridgeAgent::_handleInbound(const std::string& text) {
  auto decoded = rpc::decodeMessage(text);
  if (!decoded.has_value()) {
    std::string id = rpc::peekMessageId(text);
    if (id.empty()) {
      id = rpc::RPC_UNKNOWN_ID;
    }
    log::get()->warn("agent: malformed message ({})", rpc::toString(decoded.error()));
    const rpc::Response reply = rpc::Response::failure(
        id, std::string("Invalid message: ") + rpc::toString(decoded.error()));
    if (_client_connected) {
      _queueOutbound(rpc::ws::FrameBuilder::buildText(rpc::encode(reply), false));
    }
    return;
  }
  const rpc::Message& message = decoded.value();
  if (message.type != rpc::MessageType::REQUEST) {
    log::get()->debug("agent: ignoring non-request message {}", message.type == rpc::MessageType::EVENT
                                                                    ? message.event.id
                                                                    : message.response.id);
    return;
  }
  const rpc::Response reply = _dispatcher.dispatch(message.request);
  if (_client_connected) {
    _queueOutbound(rpc::ws::FrameBuilder::buildText(rpc::encode(reply), false));
  }
}

void BridgeAgent::_writeDiscovery() {
  rpc::DiscoveryRecord record;
  record.port = _port;
  record.pid = static_cast<int32_t>(::getpid());
  record.version = _config.channel.empty() ? rpc::PROTOCOL_VERSION : "1.1";
  record.channel = _config.channel;
  record.timestamp = _clock.unixSeconds();
  if (!rpc::writeDiscoveryRecord(_discovery_path, record)) {
    log::get()->error("agent: cannot write {}: {}", _discovery_path, strerror(errno));
    return;
  }
  _last_discovery_write = record.timestamp;
}

void BridgeAgent::_refreshDiscovery() {
  const int64_t now = _clock.unixSeconds();
  const bool missing = !util::fileExists(_discovery_path);
  if (missing || now - _last_discovery_write >= static_cast<int64_t>(_config.discovery_refresh_seconds)) {
    if (missing) {
      log::get()->info("agent: discovery record missing, rewriting");
    }
    _writeDiscovery();
  }
}

// --- Connection handling (accept thread) ---

void BridgeAgent::_acceptLoop() {
  while (_running) {
    transport::Socket socket = _listener.accept(kAcceptPollMs);
    if (!socket.valid()) {
      continue;
    }
    _serveConnection(std::move(socket));
  }
}

bool BridgeAgent::_readRequestHead(transport::Socket& socket, std::string& head) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kHandshakeReadMs);
  std::string buffer;
  while (_running && std::chrono::steady_clock::now() < deadline) {
    if (!socket.waitReadable(kAcceptPollMs)) {
      continue;
    }
    const transport::IoResult result = socket.receive(buffer, 4096);
    if (result == transport::IoResult::CLOSED || result == transport::IoResult::FAILED) {
      return false;
    }
    const size_t end = rpc::ws::findHeaderEnd(buffer);
    if (end > 0) {
      head = buffer.substr(0, end);
      return true;
    }
    if (buffer.size() > rpc::ws::kMaxHeaderBytes) {
      return false;
    }
  }
  return false;
}

void BridgeAgent::_serveConnection(transport::Socket socket) {
  std::string head;
  rpc::ws::HttpRequest request;
  if (!_readRequestHead(socket, head) || !rpc::ws::parseRequestHead(head, request)) {
    log::get()->debug("agent: dropped connection without a valid request");
    return;
  }

  if (!rpc::ws::isUpgradeRequest(request)) {
    (void)socket.sendAll(rpc::ws::buildHealthResponse(rpc::PROTOCOL_VERSION));
    return;
  }
  if (request.path != _channel_path) {
    log::get()->warn("agent: upgrade on unknown path {}", request.path);
    (void)socket.sendAll(rpc::ws::buildNotFoundResponse());
    return;
  }
  if (_client_connected) {
    log::get()->warn("agent: rejecting second client, one is already connected");
    (void)socket.sendAll(rpc::ws::buildConflictResponse());
    return;
  }

  const std::string accept_key = rpc::ws::computeAcceptKey(request.header("sec-websocket-key"));
  if (!socket.sendAll(rpc::ws::buildUpgradeResponse(accept_key))) {
    log::get()->warn("agent: handshake write failed: {}", strerror(errno));
    return;
  }
  (void)socket.setNoDelay(true);

  // Nothing left over from a previous client reaches this one. Its
  // unanswered requests were already failed on the Controller side.
  {
    std::lock_guard<std::mutex> lock(_inbound_mutex);
    _inbound.clear();
  }
  {
    std::lock_guard<std::mutex> lock(_outbound_mutex);
    _outbound.clear();
  }
  {
    std::lock_guard<std::mutex> lock(_client_mutex);
    _client = std::make_shared<transport::Socket>(std::move(socket));
    ++_client_generation;
  }
  _client_connected = true;
  log::get()->info("agent: client connected");
}

BridgeAgent::ClientPtr BridgeAgent::_currentClient(uint64_t& generation) {
  std::lock_guard<std::mutex> lock(_client_mutex);
  generation = _client_generation;
  return _client;
}

void BridgeAgent::_dropClient(const ClientPtr& client, const char* reason) {
  {
    std::lock_guard<std::mutex> lock(_client_mutex);
    if (!client || _client != client) {
      return;
    }
    _client.reset();
    _client_connected = false;
  }
  // Wakes a loop blocked on this socket; the descriptor closes when the
  // last loop releases its reference.
  client->shutdownBoth();
  {
    std::lock_guard<std::mutex> lock(_outbound_mutex);
    _outbound.clear();
  }
  log::get()->info("agent: client disconnected ({})", reason);
}

// --- Receive thread ---

bool BridgeAgent::_pushInbound(const std::string& text) {
  std::lock_guard<std::mutex> lock(_inbound_mutex);
  if (_inbound.full()) {
    return false;
  }
  _inbound.push(text);
  return true;
}

void BridgeAgent::_receiveLoop() {
  rpc::ws::FrameParser parser;
  std::deque<std::string> held;  // frames waiting for room in the inbound queue
  uint64_t parser_generation = 0;

  while (_running) {
    uint64_t generation = 0;
    ClientPtr client = _currentClient(generation);
    if (!client) {
      held.clear();
      sleepMs(_config.receive_poll_ms);
      continue;
    }
    if (generation != parser_generation) {
      parser.reset();
      held.clear();
      parser_generation = generation;
    }

    // Back-pressure: stop reading until the main thread drains the queue.
    while (!held.empty() && _pushInbound(held.front())) {
      held.pop_front();
    }
    if (!held.empty()) {
      sleepMs(_config.receive_poll_ms);
      continue;
    }

    if (!client->waitReadable(static_cast<int>(_config.receive_poll_ms))) {
      continue;
    }
    std::string chunk;
    const transport::IoResult result = client->receive(chunk, kReceiveChunk);
    if (result == transport::IoResult::WOULD_BLOCK) {
      continue;
    }
    if (result != transport::IoResult::OK) {
      _dropClient(client, result == transport::IoResult::CLOSED ? "closed by peer" : "receive error");
      continue;
    }

    parser.feed(chunk.data(), chunk.size());
    rpc::ws::Frame frame;
    while (parser.next(frame)) {
      switch (frame.opcode) {
        case rpc::ws::Opcode::TEXT:
        case rpc::ws::Opcode::BINARY:
          log::get()->debug("agent: <- {} bytes", frame.payload.size());
          if (!_pushInbound(frame.payload)) {
            held.push_back(frame.payload);
          }
          break;
        case rpc::ws::Opcode::PING:
          _queueOutbound(rpc::ws::FrameBuilder::build(rpc::ws::Opcode::PONG, frame.payload, false));
          break;
        case rpc::ws::Opcode::CLOSE:
          (void)client->sendAll(
              rpc::ws::FrameBuilder::buildClose(rpc::ws::closeCode(frame.payload), false));
          _dropClient(client, "close frame");
          break;
        default:
          break;
      }
      if (!_client_connected) {
        break;
      }
    }
    if (parser.hasError()) {
      log::get()->warn("agent: bad frame from client: {}", rpc::ws::toString(parser.error()));
      (void)client->sendAll(rpc::ws::FrameBuilder::buildClose(kCloseProtocolError, false));
      _dropClient(client, "protocol error");
    }
  }
}

// --- Send thread ---

void BridgeAgent::_queueOutbound(const std::string& frame) {
  {
    std::lock_guard<std::mutex> lock(_outbound_mutex);
    _outbound.push_back(frame);
  }
  _outbound_cv.notify_one();
}

void BridgeAgent::_sendLoop() {
  while (_running) {
    std::deque<std::string> batch;
    uint64_t generation = 0;
    ClientPtr client;
    {
      std::unique_lock<std::mutex> lock(_outbound_mutex);
      _outbound_cv.wait_for(lock, std::chrono::milliseconds(_config.send_poll_ms),
                            [this]() { return !_running || !_outbound.empty(); });
      batch.swap(_outbound);
      // Read under the queue lock: a new client is published only after
      // the queue is cleared, so this batch never goes to it.
      client = _currentClient(generation);
    }
    if (batch.empty() || !client) {
      continue;
    }
    for (const std::string& frame : batch) {
      if (!client->sendAll(frame)) {
        _dropClient(client, "send error");
        break;
      }
    }
    log::get()->debug("agent: -> {} frames", batch.size());
  }
}

}  // namespace scenelink
