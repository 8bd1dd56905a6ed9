/*
 * This file is part of SceneLink.
 * (C) 2025 Ignacio Santolin
 */
#ifndef SCENELINK_BRIDGE_AGENT_H
#define SCENELINK_BRIDGE_AGENT_H

#include <stddef.h>
#include <stdint.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "etl/queue.h"

#include "agent/command_dispatcher.h"
#include "config/scenelink_config.h"
#include "editor/editor_application.h"
#include "protocol/bridge_message.h"
#include "protocol/bridge_protocol.h"
#include "transport/socket.h"
#include "util/clock.h"

namespace scenelink {

struct AgentConfig {
  std::string project_root;
  std::string discovery_relative_path;
  uint16_t port;          // 0 = ephemeral
  std::string channel;    // empty = serve on "/"
  size_t batch_size;
  uint32_t receive_poll_ms;
  uint32_t send_poll_ms;
  uint32_t discovery_refresh_seconds;

  AgentConfig()
    : project_root(".")
    , discovery_relative_path(rpc::DISCOVERY_RELATIVE_PATH)
    , port(0)
    , batch_size(config::kAgentBatchSize)
    , receive_poll_ms(config::kReceivePollMs)
    , send_poll_ms(config::kSendPollMs)
    , discovery_refresh_seconds(config::kDiscoveryRefreshSeconds)
  {
  }
};

/**
 * @brief Read the [agent] section of a plugin descriptor.
 *
 * Recognised keys: port, channel, batch, discovery. Unknown keys and other
 * sections are ignored; a malformed number fails the whole parse and
 * leaves `out` untouched.
 */
bool parseAgentDescriptor(const std::string& text, AgentConfig& out);

/**
 * @brief Engine-side Agent: one-client WebSocket server over the editor.
 *
 * Accept, receive and send loops run on their own threads. Commands are
 * only executed from update(), which the host calls on its main thread.
 */
class BridgeAgent {
 public:
  BridgeAgent(const AgentConfig& config, editor::EditorApplication& editor, util::Clock& clock);
  ~BridgeAgent();

  BridgeAgent(const BridgeAgent&) = delete;
  BridgeAgent& operator=(const BridgeAgent&) = delete;

  // Binds, starts the loops and writes the discovery record.
  bool begin();
  // Main-thread tick: runs up to batch_size queued commands.
  void update();
  // Stops the loops, drops the client and deletes the discovery record.
  void end();

  void onBeforeReload();
  void onAfterReload();

  bool isRunning() const { return _running; }
  bool hasClient() const { return _client_connected; }
  uint16_t port() const { return _port; }
  const std::string& discoveryPath() const { return _discovery_path; }
  size_t pendingInbound();
  size_t pendingOutbound();

  // Thread-safe. Dropped unless a client is connected.
  void sendEvent(const rpc::Event& event);

 private:
  typedef std::shared_ptr<transport::Socket> ClientPtr;

  void _acceptLoop();
  void _receiveLoop();
  void _sendLoop();

  void _serveConnection(transport::Socket socket);
  bool _readRequestHead(transport::Socket& socket, std::string& head);
  ClientPtr _currentClient(uint64_t& generation);
  void _dropClient(const ClientPtr& client, const char* reason);
  bool _pushInbound(const std::string& text);
  void _queueOutbound(const std::string& frame);
  void _handleInbound(const std::string& text);
  void _writeDiscovery();
  void _refreshDiscovery();

  AgentConfig _config;
  editor::EditorApplication& _editor;
  util::Clock& _clock;
  agent::CommandDispatcher _dispatcher;
  std::string _discovery_path;
  std::string _channel_path;

  transport::Socket _listener;
  uint16_t _port;
  std::atomic<bool> _running;
  std::atomic<bool> _client_connected;
  int64_t _last_discovery_write;
  int _log_listener;
  int _play_mode_listener;

  std::thread _accept_thread;
  std::thread _receive_thread;
  std::thread _send_thread;

  std::mutex _client_mutex;
  ClientPtr _client;
  uint64_t _client_generation;

  std::mutex _inbound_mutex;
  etl::queue<std::string, config::kInboundQueueSize> _inbound;

  std::mutex _outbound_mutex;
  std::condition_variable _outbound_cv;
  std::deque<std::string> _outbound;
};

}  // namespace scenelink

#endif  // SCENELINK_BRIDGE_AGENT_H
