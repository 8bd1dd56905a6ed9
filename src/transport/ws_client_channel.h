#ifndef SCENELINK_WS_CLIENT_CHANNEL_H
#define SCENELINK_WS_CLIENT_CHANNEL_H

#include <string>
#include <vector>

#include "protocol/ws_frame.h"
#include "transport/client_channel.h"
#include "transport/socket.h"

namespace scenelink {
namespace transport {

// WebSocket client over a non-blocking loopback socket.
class WsClientChannel : public IClientChannel {
 public:
  WsClientChannel();
  ~WsClientChannel() override;

  bool open(uint16_t port, const std::string& path) override;
  void poll(std::vector<std::string>& messages) override;
  ChannelStatus status() const override { return _status; }
  bool sendText(const std::string& text) override;
  void close(uint16_t code) override;

 private:
  enum Phase {
    PHASE_IDLE,
    PHASE_TCP_CONNECTING,
    PHASE_HANDSHAKING,
    PHASE_OPEN,
    PHASE_CLOSED
  };

  void _pollConnect();
  void _pollHandshake();
  void _pollFrames(std::vector<std::string>& messages);
  bool _readAvailable(std::string& into);
  bool _flushOutbox();
  void _fail(const char* reason);

  Socket _socket;
  Phase _phase;
  ChannelStatus _status;
  uint16_t _port;
  std::string _path;
  std::string _client_key;
  std::string _inbox;
  std::string _outbox;
  rpc::ws::FrameParser _parser;
  bool _close_sent;
};

}  // namespace transport
}  // namespace scenelink

#endif  // SCENELINK_WS_CLIENT_CHANNEL_H
