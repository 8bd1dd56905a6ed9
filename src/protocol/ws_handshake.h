#ifndef RPC_WS_HANDSHAKE_H
#define RPC_WS_HANDSHAKE_H

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>

namespace rpc {
namespace ws {

// RFC 6455 section 1.3 GUID.
constexpr const char* kHandshakeGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t kMaxHeaderBytes = 8192;

struct HttpRequest {
  std::string method;
  std::string path;
  std::map<std::string, std::string> headers;  // lower-case keys

  std::string header(const std::string& name) const;
};

struct HttpResponse {
  int status;
  std::map<std::string, std::string> headers;  // lower-case keys

  HttpResponse() : status(0) {}
  std::string header(const std::string& name) const;
};

// Length of the header block including the blank line, or 0 when the
// terminating CRLFCRLF has not arrived yet.
size_t findHeaderEnd(const std::string& buffer);

bool parseRequestHead(const std::string& head, HttpRequest& out);
bool parseResponseHead(const std::string& head, HttpResponse& out);

// "Upgrade: websocket" plus a Sec-WebSocket-Key.
bool isUpgradeRequest(const HttpRequest& request);

std::string computeAcceptKey(const std::string& client_key);
std::string generateClientKey();

// "/" without a channel, "/<channel>" otherwise.
std::string channelPath(const std::string& channel);

std::string buildUpgradeRequest(const std::string& host, uint16_t port,
                                const std::string& path, const std::string& key);
std::string buildUpgradeResponse(const std::string& accept_key);
std::string buildHealthResponse(const std::string& version);
std::string buildConflictResponse();
std::string buildNotFoundResponse();

bool validateUpgradeResponse(const HttpResponse& response, const std::string& client_key);

}  // namespace ws
}  // namespace rpc

#endif  // RPC_WS_HANDSHAKE_H
