/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#include "BridgeController.h"

#include <stdio.h>

#include "protocol/bridge_protocol.h"
#include "protocol/ws_handshake.h"
#include "transport/ws_client_channel.h"
#include "util/log.h"

namespace scenelink {

namespace {

transport::ChannelFactory defaultChannelFactory() {
  return []() {
    return std::unique_ptr<transport::IClientChannel>(new transport::WsClientChannel());
  };
}

// "[x,y,z]", the bracketed form the Agent's vector parser accepts.
std::string formatVector(const std::vector<double>& values) {
  std::string out = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    char number[32];
    (void)snprintf(number, sizeof(number), "%g", values[i]);
    if (i > 0) {
      out += ",";
    }
    out += number;
  }
  out += "]";
  return out;
}

}  // namespace

const char* toString(SendError error) {
  switch (error) {
    case SendError::NOT_CONNECTED:   return "Not connected to the editor";
    case SendError::TRANSMIT_FAILED: return "Transmit failed";
  }
  return "unknown";
}

BridgeController::BridgeController(const ControllerConfig& config, util::Clock& clock)
    : BridgeController(config, clock, defaultChannelFactory()) {}

BridgeController::BridgeController(const ControllerConfig& config, util::Clock& clock,
                                   const transport::ChannelFactory& factory)
    : _config(config),
      _clock(clock),
      _factory(factory),
      _poller(config.project_root, config.stale_record_seconds, clock),
      _reconnect_attempts(0),
      _last_tick_millis(0),
      _begun(false),
      _published_state(fsm::STATE_DISCONNECTED),
      _play_mode(rpc::PlayModeState::STOPPED),
      _provisioning(InstallResult::UP_TO_DATE) {
  _router.setHandler(this);
  _fsm.setObserver(this);
  _fsm.begin();
  _published_state = _fsm.state();
}

BridgeController::~BridgeController() {
  _timers.clear();
  _dropChannel(rpc::RPC_CLOSE_NORMAL);
  const size_t rejected = _pending.rejectAll(controller::CommandStatus::CANCELLED,
                                             rpc::RPC_ERROR_DISCONNECTED_BY_USER);
  if (rejected > 0) {
    log::get()->info("controller destroyed; cancelled {} pending command(s)", rejected);
  }
}

void BridgeController::begin() {
  if (_begun) {
    return;
  }
  _begun = true;
  _last_tick_millis = _clock.millis();

  // Provisioning failures are logged by the installer and never gate
  // discovery.
  if (_config.auto_provision) {
    _provisioning = PluginInstaller().ensureInstalled(_config.project_root);
  }

  log::get()->info("watching {} for an editor agent", _poller.path());
  _startPolling(true);
}

void BridgeController::end() {
  if (!_begun) {
    return;
  }
  disconnect();
  _timers.clear();
  _begun = false;
}

void BridgeController::process() {
  if (!_begun) {
    return;
  }
  _pollChannel();
  _tickTimers();
  (void)_pending.expire(_clock.millis());
}

void BridgeController::_tickTimers() {
  const uint32_t now = _clock.millis();
  uint32_t delta = now - _last_tick_millis;
  if (delta > config::kMaxTickDeltaMs) {
    delta = config::kMaxTickDeltaMs;
  }
  if (delta > 0U) {
    _timers.tick(delta);
    _last_tick_millis = now;
  }
}

void BridgeController::connect() {
  if (_fsm.isConnected() || _fsm.isConnecting()) {
    return;
  }
  rpc::DiscoveryRecord record;
  if (_readRecord(record)) {
    _startAttempt(record);
  }
}

void BridgeController::disconnect() {
  _stopPolling();
  _cancelAttemptTimers();
  _dropChannel(rpc::RPC_CLOSE_NORMAL);
  _reconnect_attempts = 0;
  _fsm.resetFsm();
  _publishState();
  const size_t rejected = _pending.rejectAll(controller::CommandStatus::CANCELLED,
                                             rpc::RPC_ERROR_DISCONNECTED_BY_USER);
  if (rejected > 0) {
    log::get()->info("disconnected; cancelled {} pending command(s)", rejected);
  }
}

void BridgeController::retryNow() {
  if (_fsm.isConnected()) {
    log::get()->debug("retry ignored: already connected");
    return;
  }
  log::get()->info("manual retry requested");
  _cancelAttemptTimers();
  _dropChannel(rpc::RPC_CLOSE_NORMAL);
  _reconnect_attempts = 0;
  _fsm.resetFsm();
  _publishState();
  _startPolling(true);
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

void BridgeController::_startPolling(bool immediate) {
  _timers.register_timer(this, scheduler::TIMER_DISCOVERY_POLL, _config.discovery_poll_ms, true);
  if (immediate) {
    _pollDiscovery();
  }
}

void BridgeController::_stopPolling() {
  _timers.unregister_timer(scheduler::TIMER_DISCOVERY_POLL);
  _timers.unregister_timer(scheduler::TIMER_FAST_REPOLL);
}

void BridgeController::_pollDiscovery() {
  if (!_fsm.isDisconnected()) {
    return;
  }
  rpc::DiscoveryRecord record;
  if (_readRecord(record)) {
    _startAttempt(record);
  }
}

bool BridgeController::_readRecord(rpc::DiscoveryRecord& out) {
  if (_poller.poll(out) != controller::PollOutcome::FRESH) {
    return false;
  }
  if (!rpc::isSupportedProtocolVersion(out.version) && _warned_versions.insert(out.version).second) {
    log::get()->warn("agent speaks protocol {} (supported: {}); connecting anyway", out.version,
                     rpc::PROTOCOL_VERSION);
    if (_compat_handler) {
      _compat_handler(out.version);
    }
  }
  return true;
}

// ---------------------------------------------------------------------------
// Connection lifecycle
// ---------------------------------------------------------------------------

void BridgeController::_startAttempt(const rpc::DiscoveryRecord& record) {
  _record = record;
  _timers.unregister_timer(scheduler::TIMER_FAST_REPOLL);
  _dropChannel(rpc::RPC_CLOSE_NORMAL);
  _channel = _factory();

  _fsm.connect();
  _publishState();
  log::get()->info("connecting to agent at ws://{}:{}{}", rpc::LOOPBACK_HOST, record.port,
                   rpc::ws::channelPath(record.channel));
  _timers.register_timer(this, scheduler::TIMER_HANDSHAKE_TIMEOUT,
                         _config.handshake_timeout_ms, false);

  if (!_channel || !_channel->open(record.port, rpc::ws::channelPath(record.channel))) {
    _onAttemptFailed();
  }
}

void BridgeController::_pollChannel() {
  if (!_channel) {
    return;
  }
  std::vector<std::string> messages;
  _channel->poll(messages);

  if (_fsm.isConnecting()) {
    const transport::ChannelStatus status = _channel->status();
    if (status == transport::ChannelStatus::OPEN) {
      _onChannelOpened();
    } else if (status == transport::ChannelStatus::CLOSED) {
      _onAttemptFailed();
      return;
    }
  }

  if (!_fsm.isConnected()) {
    return;
  }
  for (size_t i = 0; i < messages.size(); ++i) {
    _router.route(messages[i]);
    // A handler may have disconnected us.
    if (!_fsm.isConnected() || !_channel) {
      return;
    }
  }
  if (_channel->status() == transport::ChannelStatus::CLOSED) {
    _onChannelClosed();
  }
}

void BridgeController::_onChannelOpened() {
  _timers.unregister_timer(scheduler::TIMER_HANDSHAKE_TIMEOUT);
  _stopPolling();
  _reconnect_attempts = 0;
  _fsm.opened();
  _publishState();
  log::get()->info("connected to agent (pid {}, protocol {})", _record.pid, _record.version);
}

void BridgeController::_onAttemptFailed() {
  _timers.unregister_timer(scheduler::TIMER_HANDSHAKE_TIMEOUT);
  _dropChannel(rpc::RPC_CLOSE_NORMAL);
  const bool resume_reconnect = _reconnect_attempts > 0;
  _fsm.connectFailed(resume_reconnect);
  _publishState();
  if (resume_reconnect) {
    _scheduleReconnect();
  } else {
    log::get()->debug("connection attempt failed; re-polling in {} ms", _config.fast_repoll_ms);
    _timers.register_timer(this, scheduler::TIMER_FAST_REPOLL, _config.fast_repoll_ms, false);
  }
}

void BridgeController::_onChannelClosed() {
  _dropChannel(rpc::RPC_CLOSE_NORMAL);
  _fsm.socketClosed();
  _publishState();
  const size_t rejected = _pending.rejectAll(controller::CommandStatus::CONNECTION_CLOSED,
                                             rpc::RPC_ERROR_CONNECTION_CLOSED);
  log::get()->warn("connection to agent lost; {} pending command(s) rejected", rejected);
  _scheduleReconnect();
}

void BridgeController::_scheduleReconnect() {
  if (_reconnect_attempts >= _config.max_reconnect_attempts) {
    log::get()->warn("giving up after {} reconnect attempt(s); resuming discovery",
                     _reconnect_attempts);
    _reconnect_attempts = 0;
    _fsm.giveUp();
    _publishState();
    _startPolling(false);
    return;
  }
  ++_reconnect_attempts;
  log::get()->info("reconnect attempt {}/{} in {} ms", _reconnect_attempts,
                   _config.max_reconnect_attempts, _config.reconnect_delay_ms);
  _timers.register_timer(this, scheduler::TIMER_RECONNECT_DELAY, _config.reconnect_delay_ms, false);
}

void BridgeController::_onReconnectDelayElapsed() {
  if (!_fsm.isReconnecting()) {
    return;
  }
  // The port may have changed across a domain reload; always re-read.
  rpc::DiscoveryRecord record;
  if (_readRecord(record)) {
    _startAttempt(record);
    return;
  }
  _scheduleReconnect();
}

void BridgeController::_cancelAttemptTimers() {
  _timers.unregister_timer(scheduler::TIMER_HANDSHAKE_TIMEOUT);
  _timers.unregister_timer(scheduler::TIMER_RECONNECT_DELAY);
  _timers.unregister_timer(scheduler::TIMER_FAST_REPOLL);
}

void BridgeController::_dropChannel(uint16_t close_code) {
  if (!_channel) {
    return;
  }
  if (_channel->status() != transport::ChannelStatus::CLOSED) {
    _channel->close(close_code);
  }
  _channel.reset();
}

void BridgeController::_publishState() {
  const fsm::StateId current = _fsm.state();
  if (current == _published_state) {
    return;
  }
  _published_state = current;
  if (_state_handler) {
    _state_handler(current);
  }
}

void BridgeController::on_timer(scheduler::TimerId id) {
  switch (id) {
    case scheduler::TIMER_DISCOVERY_POLL:
    case scheduler::TIMER_FAST_REPOLL:
      _pollDiscovery();
      break;
    case scheduler::TIMER_HANDSHAKE_TIMEOUT:
      if (_fsm.isConnecting()) {
        log::get()->warn("handshake with port {} timed out", _record.port);
        _onAttemptFailed();
      }
      break;
    case scheduler::TIMER_RECONNECT_DELAY:
      _onReconnectDelayElapsed();
      break;
    default:
      break;
  }
}

void BridgeController::onStateEntered(fsm::StateId state) {
  log::get()->debug("connection state -> {}", fsm::stateName(state));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

etl::expected<std::string, SendError> BridgeController::sendCommand(
    const std::string& category, const std::string& action, const rpc::ParamMap& params,
    const ResponseHandler& handler) {
  if (!_fsm.isConnected() || !_channel) {
    return etl::unexpected<SendError>(SendError::NOT_CONNECTED);
  }
  rpc::Request request;
  request.id = rpc::generateMessageId();
  request.category = category;
  request.action = action;
  request.params = params;

  _pending.add(request.id, request.key(), _clock.millis(), _config.command_timeout_ms, handler);
  if (!_channel->sendText(rpc::encode(request))) {
    (void)_pending.discard(request.id);
    log::get()->warn("could not transmit {}", request.key());
    return etl::unexpected<SendError>(SendError::TRANSMIT_FAILED);
  }
  log::get()->debug("-> {} ({})", request.key(), request.id);
  return request.id;
}

etl::expected<std::string, SendError> BridgeController::getSceneHierarchy(
    const ResponseHandler& handler) {
  return sendCommand("scene", "getHierarchy", rpc::ParamMap(), handler);
}

etl::expected<std::string, SendError> BridgeController::createGameObject(
    const std::string& name, const std::string& parent_path, const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["name"] = name;
  if (!parent_path.empty()) {
    params["parentPath"] = parent_path;
  }
  return sendCommand("gameObject", "create", params, handler);
}

etl::expected<std::string, SendError> BridgeController::createPrimitive(
    const std::string& name, const std::string& primitive_type, const std::string& parent_path,
    const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["name"] = name;
  params["primitiveType"] = primitive_type;
  if (!parent_path.empty()) {
    params["parentPath"] = parent_path;
  }
  return sendCommand("gameObject", "createPrimitive", params, handler);
}

etl::expected<std::string, SendError> BridgeController::setTransform(
    const std::string& path, const std::vector<double>& position,
    const std::vector<double>& rotation, const std::vector<double>& scale,
    const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["gameObjectPath"] = path;
  if (!position.empty()) {
    params["position"] = formatVector(position);
  }
  if (!rotation.empty()) {
    params["rotation"] = formatVector(rotation);
  }
  if (!scale.empty()) {
    params["scale"] = formatVector(scale);
  }
  return sendCommand("gameObject", "setTransform", params, handler);
}

etl::expected<std::string, SendError> BridgeController::addComponent(
    const std::string& path, const std::string& component_type, const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["gameObjectPath"] = path;
  params["componentType"] = component_type;
  return sendCommand("component", "add", params, handler);
}

etl::expected<std::string, SendError> BridgeController::setComponentProperty(
    const std::string& path, const std::string& component_type, const std::string& property,
    const std::string& value, const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["gameObjectPath"] = path;
  params["componentType"] = component_type;
  params["propertyName"] = property;
  params["value"] = value;
  return sendCommand("component", "setProperty", params, handler);
}

etl::expected<std::string, SendError> BridgeController::createPrefab(
    const std::string& path, const std::string& asset_path, const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["gameObjectPath"] = path;
  if (!asset_path.empty()) {
    params["assetPath"] = asset_path;
  }
  return sendCommand("prefab", "create", params, handler);
}

etl::expected<std::string, SendError> BridgeController::instantiatePrefab(
    const std::string& prefab_path, const ResponseHandler& handler) {
  rpc::ParamMap params;
  params["prefabPath"] = prefab_path;
  return sendCommand("prefab", "instantiate", params, handler);
}

etl::expected<std::string, SendError> BridgeController::getPlayModeState(
    const ResponseHandler& handler) {
  return sendCommand("editor", "getPlayMode", rpc::ParamMap(), handler);
}

etl::expected<std::string, SendError> BridgeController::getSelectedObjects(
    const ResponseHandler& handler) {
  return sendCommand("gameObject", "getSelected", rpc::ParamMap(), handler);
}

// ---------------------------------------------------------------------------
// Routed messages
// ---------------------------------------------------------------------------

void BridgeController::onRequest(const rpc::Request& request) {
  log::get()->warn("ignoring request {} sent to the controller", request.key());
}

void BridgeController::onResponse(const rpc::Response& response) {
  (void)_pending.resolve(response);
}

void BridgeController::onEvent(const rpc::Event& event) {
  if (event.name == rpc::RPC_EVENT_CONSOLE_LOG) {
    rpc::ConsoleLogEvent entry;
    if (!rpc::parseConsoleLogEvent(event.data, entry)) {
      log::get()->debug("dropping malformed console.log event {}", event.id);
      return;
    }
    if (_console_handler) {
      _console_handler(entry);
    }
    return;
  }
  if (event.name == rpc::RPC_EVENT_PLAY_MODE_CHANGED) {
    rpc::PlayModeState state;
    if (!rpc::parsePlayModeChangedEvent(event.data, state)) {
      log::get()->debug("dropping malformed playModeChanged event {}", event.id);
      return;
    }
    _play_mode = state;
    if (_play_mode_handler) {
      _play_mode_handler(state);
    }
    return;
  }
  log::get()->debug("unhandled event {}", event.name);
}

void BridgeController::onMalformed(const std::string& raw, rpc::MessageError error) {
  log::get()->warn("dropping malformed frame ({}): {:.80}", rpc::toString(error), raw);
}

}  // namespace scenelink
