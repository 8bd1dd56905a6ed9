#ifndef SCENELINK_SOCKET_H
#define SCENELINK_SOCKET_H

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace scenelink {
namespace transport {

enum class IoResult : uint8_t {
  OK,
  WOULD_BLOCK,
  CLOSED,
  FAILED
};

// Owning wrapper around a POSIX TCP socket descriptor. Move-only; the
// descriptor is closed on destruction.
class Socket {
 public:
  Socket();
  explicit Socket(int fd);
  ~Socket();

  Socket(Socket&& other);
  Socket& operator=(Socket&& other);
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  bool valid() const { return _fd >= 0; }
  int fd() const { return _fd; }
  void close();
  void shutdownBoth();

  bool setNonBlocking(bool enabled);
  bool setNoDelay(bool enabled);

  // poll(2) wrappers. Return true when the socket is ready (or has an error
  // condition pending, which the following read/write will surface).
  bool waitReadable(int timeout_ms) const;
  bool waitWritable(int timeout_ms) const;

  // Appends up to max_bytes to out.
  IoResult receive(std::string& out, size_t max_bytes = 4096);
  // Sends as much as the kernel accepts; sent reports the count.
  IoResult sendSome(const char* data, size_t length, size_t& sent);
  // Blocking send of the whole buffer (blocking sockets only).
  bool sendAll(const std::string& data);

  uint16_t localPort() const;

  // Pending non-blocking connect finished successfully.
  bool connectSucceeded() const;

  // Binds 127.0.0.1:<port> (0 = ephemeral) and listens.
  static Socket listenLoopback(uint16_t port, int backlog);
  // Starts a non-blocking connect to 127.0.0.1:<port>.
  static Socket connectLoopback(uint16_t port);

  Socket accept(int timeout_ms) const;

 private:
  int _fd;
};

}  // namespace transport
}  // namespace scenelink

#endif  // SCENELINK_SOCKET_H
