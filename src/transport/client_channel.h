#ifndef SCENELINK_CLIENT_CHANNEL_H
#define SCENELINK_CLIENT_CHANNEL_H

#include <stdint.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scenelink {
namespace transport {

enum class ChannelStatus : uint8_t {
  IDLE,
  CONNECTING,  // TCP connect or HTTP upgrade in flight
  OPEN,
  CLOSED
};

/**
 * @brief Message channel the Controller talks through.
 *
 * Everything is non-blocking: open() only starts the attempt and poll()
 * advances it, so the Controller can interleave discovery, timers and
 * traffic on one thread. A channel is single-use; once CLOSED a new one is
 * created for the next attempt.
 */
class IClientChannel {
 public:
  virtual ~IClientChannel() {}

  virtual bool open(uint16_t port, const std::string& path) = 0;

  // Advances the connection and appends every complete inbound text
  // message to messages.
  virtual void poll(std::vector<std::string>& messages) = 0;

  virtual ChannelStatus status() const = 0;
  virtual bool sendText(const std::string& text) = 0;
  virtual void close(uint16_t code) = 0;
};

typedef std::function<std::unique_ptr<IClientChannel>()> ChannelFactory;

}  // namespace transport
}  // namespace scenelink

#endif  // SCENELINK_CLIENT_CHANNEL_H
