/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#ifndef SCENELINK_BRIDGE_CONTROLLER_H
#define SCENELINK_BRIDGE_CONTROLLER_H

#include <stddef.h>
#include <stdint.h>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "etl/expected.h"

#include "PluginInstaller.h"
#include "config/scenelink_config.h"
#include "controller/discovery_poller.h"
#include "controller/pending_requests.h"
#include "fsm/connection_fsm.h"
#include "protocol/bridge_message.h"
#include "protocol/discovery_record.h"
#include "router/message_router.h"
#include "scheduler/bridge_scheduler.h"
#include "transport/client_channel.h"
#include "util/clock.h"

namespace scenelink {

struct ControllerConfig {
  std::string project_root;
  uint32_t discovery_poll_ms;
  uint32_t fast_repoll_ms;
  uint32_t handshake_timeout_ms;
  uint32_t reconnect_delay_ms;
  uint8_t max_reconnect_attempts;
  uint32_t command_timeout_ms;
  uint32_t stale_record_seconds;
  bool auto_provision;

  ControllerConfig()
    : project_root(".")
    , discovery_poll_ms(config::kDiscoveryPollMs)
    , fast_repoll_ms(config::kFastRepollMs)
    , handshake_timeout_ms(config::kHandshakeTimeoutMs)
    , reconnect_delay_ms(config::kReconnectDelayMs)
    , max_reconnect_attempts(config::kMaxReconnectAttempts)
    , command_timeout_ms(config::kCommandTimeoutMs)
    , stale_record_seconds(config::kStaleRecordSeconds)
    , auto_provision(true)
  {
  }
};

enum class SendError : uint8_t {
  NOT_CONNECTED,
  TRANSMIT_FAILED
};

const char* toString(SendError error);

/**
 * @brief Host-side Controller: discovery, connection lifecycle, correlation.
 *
 * Single-threaded and cooperative. Call process() from the owner's loop; it
 * advances the channel, routes inbound messages, runs timers and expires
 * pending commands. No method blocks.
 */
class BridgeController : public router::IMessageHandler,
                         public scheduler::TimerHandler,
                         public fsm::ConnectionObserver {
 public:
  typedef std::function<void(fsm::StateId)> StateHandler;
  typedef std::function<void(const rpc::ConsoleLogEvent&)> ConsoleLogHandler;
  typedef std::function<void(rpc::PlayModeState)> PlayModeHandler;
  typedef std::function<void(const std::string&)> CompatibilityHandler;

  BridgeController(const ControllerConfig& config, util::Clock& clock);
  BridgeController(const ControllerConfig& config, util::Clock& clock,
                   const transport::ChannelFactory& factory);
  ~BridgeController() override;

  void begin();
  void process();
  void end();

  // Reads the discovery record now and attempts a connection if it is
  // fresh. No-op while Connected or Connecting.
  void connect();
  void disconnect();
  void retryNow();

  fsm::StateId state() const { return _fsm.state(); }
  bool isConnected() const { return _fsm.isConnected(); }
  uint8_t reconnectAttempts() const { return _reconnect_attempts; }
  bool isPolling() const { return _timers.is_active(scheduler::TIMER_DISCOVERY_POLL); }
  size_t pendingCount() const { return _pending.size(); }
  rpc::PlayModeState lastPlayModeState() const { return _play_mode; }
  const rpc::DiscoveryRecord& lastRecord() const { return _record; }
  InstallResult provisioningResult() const { return _provisioning; }
  const std::string& discoveryPath() const { return _poller.path(); }

  etl::expected<std::string, SendError> sendCommand(const std::string& category,
                                                    const std::string& action,
                                                    const rpc::ParamMap& params,
                                                    const ResponseHandler& handler);

  // Convenience wrappers over sendCommand.
  etl::expected<std::string, SendError> getSceneHierarchy(const ResponseHandler& handler);
  etl::expected<std::string, SendError> createGameObject(const std::string& name,
                                                         const std::string& parent_path,
                                                         const ResponseHandler& handler);
  etl::expected<std::string, SendError> createPrimitive(const std::string& name,
                                                        const std::string& primitive_type,
                                                        const std::string& parent_path,
                                                        const ResponseHandler& handler);
  // Empty vectors leave that part of the transform untouched.
  etl::expected<std::string, SendError> setTransform(const std::string& path,
                                                     const std::vector<double>& position,
                                                     const std::vector<double>& rotation,
                                                     const std::vector<double>& scale,
                                                     const ResponseHandler& handler);
  etl::expected<std::string, SendError> addComponent(const std::string& path,
                                                     const std::string& component_type,
                                                     const ResponseHandler& handler);
  etl::expected<std::string, SendError> setComponentProperty(const std::string& path,
                                                             const std::string& component_type,
                                                             const std::string& property,
                                                             const std::string& value,
                                                             const ResponseHandler& handler);
  etl::expected<std::string, SendError> createPrefab(const std::string& path,
                                                     const std::string& asset_path,
                                                     const ResponseHandler& handler);
  etl::expected<std::string, SendError> instantiatePrefab(const std::string& prefab_path,
                                                          const ResponseHandler& handler);
  etl::expected<std::string, SendError> getPlayModeState(const ResponseHandler& handler);
  etl::expected<std::string, SendError> getSelectedObjects(const ResponseHandler& handler);

  // Observers
  void onConnectionStateChanged(const StateHandler& handler) { _state_handler = handler; }
  void onConsoleLog(const ConsoleLogHandler& handler) { _console_handler = handler; }
  void onPlayModeChanged(const PlayModeHandler& handler) { _play_mode_handler = handler; }
  void onCompatibilityWarning(const CompatibilityHandler& handler) { _compat_handler = handler; }

  // router::IMessageHandler
  void onRequest(const rpc::Request& request) override;
  void onResponse(const rpc::Response& response) override;
  void onEvent(const rpc::Event& event) override;
  void onMalformed(const std::string& raw, rpc::MessageError error) override;

  // scheduler::TimerHandler
  void on_timer(scheduler::TimerId id) override;

  // fsm::ConnectionObserver
  void onStateEntered(fsm::StateId state) override;

 private:
  void _pollDiscovery();
  bool _readRecord(rpc::DiscoveryRecord& out);
  void _startAttempt(const rpc::DiscoveryRecord& record);
  void _pollChannel();
  void _onChannelOpened();
  void _onAttemptFailed();
  void _onChannelClosed();
  void _scheduleReconnect();
  void _onReconnectDelayElapsed();
  void _startPolling(bool immediate);
  void _stopPolling();
  void _cancelAttemptTimers();
  void _dropChannel(uint16_t close_code);
  void _publishState();
  void _tickTimers();

  ControllerConfig _config;
  util::Clock& _clock;
  transport::ChannelFactory _factory;
  fsm::ConnectionFsm _fsm;
  router::MessageRouter _router;
  scheduler::TimerService _timers;
  controller::DiscoveryPoller _poller;
  controller::PendingRequestTable _pending;
  std::unique_ptr<transport::IClientChannel> _channel;

  rpc::DiscoveryRecord _record;
  std::set<std::string> _warned_versions;
  uint8_t _reconnect_attempts;
  uint32_t _last_tick_millis;
  bool _begun;
  fsm::StateId _published_state;
  rpc::PlayModeState _play_mode;
  InstallResult _provisioning;

  StateHandler _state_handler;
  ConsoleLogHandler _console_handler;
  PlayModeHandler _play_mode_handler;
  CompatibilityHandler _compat_handler;
};

}  // namespace scenelink

#endif  // SCENELINK_BRIDGE_CONTROLLER_H
