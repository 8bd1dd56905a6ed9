#include "transport/socket.h"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include "etl/array.h"
#include "util/log.h"

namespace scenelink {
namespace transport {

namespace {

bool waitFor(int fd, short events, int timeout_ms) {
  if (fd < 0) {
    return false;
  }
  struct pollfd pfd;
  pfd.fd = fd;
  pfd.events = events;
  pfd.revents = 0;
  int rc;
  do {
    rc = ::poll(&pfd, 1, timeout_ms);
  } while (rc < 0 && errno == EINTR);
  return rc > 0;
}

sockaddr_in loopbackAddress(uint16_t port) {
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  return addr;
}

}  // namespace

Socket::Socket() : _fd(-1) {}

Socket::Socket(int fd) : _fd(fd) {}

Socket::~Socket() {
  close();
}

Socket::Socket(Socket&& other) : _fd(other._fd) {
  other._fd = -1;
}

Socket& Socket::operator=(Socket&& other) {
  if (this != &other) {
    close();
    _fd = other._fd;
    other._fd = -1;
  }
  return *this;
}

void Socket::close() {
  if (_fd >= 0) {
    (void)::close(_fd);
    _fd = -1;
  }
}

void Socket::shutdownBoth() {
  if (_fd >= 0) {
    (void)::shutdown(_fd, SHUT_RDWR);
  }
}

bool Socket::setNonBlocking(bool enabled) {
  const int flags = ::fcntl(_fd, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  const int updated = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(_fd, F_SETFL, updated) == 0;
}

bool Socket::setNoDelay(bool enabled) {
  const int value = enabled ? 1 : 0;
  return ::setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &value, sizeof(value)) == 0;
}

bool Socket::waitReadable(int timeout_ms) const {
  return waitFor(_fd, POLLIN, timeout_ms);
}

bool Socket::waitWritable(int timeout_ms) const {
  return waitFor(_fd, POLLOUT, timeout_ms);
}

IoResult Socket::receive(std::string& out, size_t max_bytes) {
  etl::array<char, 4096> chunk;
  const size_t want = max_bytes < chunk.size() ? max_bytes : chunk.size();
  ssize_t n;
  do {
    n = ::recv(_fd, chunk.data(), want, 0);
  } while (n < 0 && errno == EINTR);
  if (n > 0) {
    out.append(chunk.data(), static_cast<size_t>(n));
    return IoResult::OK;
  }
  if (n == 0) {
    return IoResult::CLOSED;
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK) {
    return IoResult::WOULD_BLOCK;
  }
  if (errno == ECONNRESET || errno == EPIPE) {
    return IoResult::CLOSED;
  }
  return IoResult::FAILED;
}

IoResult Socket::sendSome(const char* data, size_t length, size_t& sent) {
  sent = 0;
  if (length == 0) {
    return IoResult::OK;
  }
  ssize_t n;
  do {
    n = ::send(_fd, data, length, MSG_NOSIGNAL);
  } while (n < 0 && errno == EINTR);
  if (n >= 0) {
    sent = static_cast<size_t>(n);
    return IoResult::OK;
  }
  if (errno == EAGAIN || errno == EWOULDBLOCK) {
    return IoResult::WOULD_BLOCK;
  }
  if (errno == ECONNRESET || errno == EPIPE) {
    return IoResult::CLOSED;
  }
  return IoResult::FAILED;
}

bool Socket::sendAll(const std::string& data) {
  size_t offset = 0;
  while (offset < data.size()) {
    size_t sent = 0;
    const IoResult result = sendSome(data.data() + offset, data.size() - offset, sent);
    if (result == IoResult::WOULD_BLOCK) {
      if (!waitWritable(1000)) {
        return false;
      }
      continue;
    }
    if (result != IoResult::OK) {
      return false;
    }
    offset += sent;
  }
  return true;
}

uint16_t Socket::localPort() const {
  sockaddr_in addr;
  socklen_t len = sizeof(addr);
  if (::getsockname(_fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  return ntohs(addr.sin_port);
}

bool Socket::connectSucceeded() const {
  int error = 0;
  socklen_t len = sizeof(error);
  if (::getsockopt(_fd, SOL_SOCKET, SO_ERROR, &error, &len) != 0) {
    return false;
  }
  return error == 0;
}

Socket Socket::listenLoopback(uint16_t port, int backlog) {
  Socket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!sock.valid()) {
    log::get()->error("socket() failed: {}", strerror(errno));
    return Socket();
  }
  const int reuse = 1;
  (void)::setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
  sockaddr_in addr = loopbackAddress(port);
  if (::bind(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    log::get()->error("bind(127.0.0.1:{}) failed: {}", port, strerror(errno));
    return Socket();
  }
  if (::listen(sock.fd(), backlog) != 0) {
    log::get()->error("listen() failed: {}", strerror(errno));
    return Socket();
  }
  return sock;
}

Socket Socket::connectLoopback(uint16_t port) {
  Socket sock(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
  if (!sock.valid() || !sock.setNonBlocking(true)) {
    return Socket();
  }
  (void)sock.setNoDelay(true);
  sockaddr_in addr = loopbackAddress(port);
  const int rc = ::connect(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (rc != 0 && errno != EINPROGRESS) {
    log::get()->debug("connect(127.0.0.1:{}) failed: {}", port, strerror(errno));
    return Socket();
  }
  return sock;
}

Socket Socket::accept(int timeout_ms) const {
  if (!waitReadable(timeout_ms)) {
    return Socket();
  }
  int fd;
  do {
    fd = ::accept4(_fd, nullptr, nullptr, SOCK_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  return Socket(fd);
}

}  // namespace transport
}  // namespace scenelink
