#include "protocol/ws_handshake.h"

#include <stdlib.h>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include "etl/array.h"
#include "util/string_utils.h"

namespace rpc {
namespace ws {

namespace {

std::string base64(const unsigned char* data, size_t length) {
  std::string out(4 * ((length + 2) / 3) + 1, '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                      data, static_cast<int>(length));
  out.resize(written > 0 ? static_cast<size_t>(written) : 0);
  return out;
}

// Splits "Name: value" lines after the first line into lower-cased keys.
bool parseHeaders(const std::string& head, std::string& first_line,
                  std::map<std::string, std::string>& headers) {
  const std::vector<std::string> lines = scenelink::util::split(head, '\n');
  if (lines.empty()) {
    return false;
  }
  first_line = scenelink::util::trim(lines[0]);
  if (first_line.empty()) {
    return false;
  }
  for (size_t i = 1; i < lines.size(); ++i) {
    const std::string line = scenelink::util::trim(lines[i]);
    if (line.empty()) {
      continue;
    }
    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
      return false;
    }
    headers[scenelink::util::toLower(scenelink::util::trim(line.substr(0, colon)))] =
        scenelink::util::trim(line.substr(colon + 1));
  }
  return true;
}

std::string lookup(const std::map<std::string, std::string>& headers, const std::string& name) {
  std::map<std::string, std::string>::const_iterator it =
      headers.find(scenelink::util::toLower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool headerHasToken(const std::string& value, const char* token) {
  const std::vector<std::string> parts = scenelink::util::split(value, ',');
  for (size_t i = 0; i < parts.size(); ++i) {
    if (scenelink::util::equalsIgnoreCase(scenelink::util::trim(parts[i]), token)) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string HttpRequest::header(const std::string& name) const { return lookup(headers, name); }
std::string HttpResponse::header(const std::string& name) const { return lookup(headers, name); }

size_t findHeaderEnd(const std::string& buffer) {
  const size_t pos = buffer.find("\r\n\r\n");
  return pos == std::string::npos ? 0 : pos + 4;
}

bool parseRequestHead(const std::string& head, HttpRequest& out) {
  std::string first_line;
  if (!parseHeaders(head, first_line, out.headers)) {
    return false;
  }
  const std::vector<std::string> parts = scenelink::util::split(first_line, ' ');
  if (parts.size() < 3 || !scenelink::util::startsWith(parts[2], "HTTP/")) {
    return false;
  }
  out.method = parts[0];
  out.path = parts[1];
  return true;
}

bool parseResponseHead(const std::string& head, HttpResponse& out) {
  std::string first_line;
  if (!parseHeaders(head, first_line, out.headers)) {
    return false;
  }
  const std::vector<std::string> parts = scenelink::util::split(first_line, ' ');
  if (parts.size() < 2 || !scenelink::util::startsWith(parts[0], "HTTP/")) {
    return false;
  }
  out.status = atoi(parts[1].c_str());
  return out.status > 0;
}

bool isUpgradeRequest(const HttpRequest& request) {
  return scenelink::util::equalsIgnoreCase(request.header("upgrade"), "websocket") &&
         headerHasToken(request.header("connection"), "upgrade") &&
         !request.header("sec-websocket-key").empty();
}

std::string computeAcceptKey(const std::string& client_key) {
  const std::string material = client_key + kHandshakeGuid;
  etl::array<unsigned char, SHA_DIGEST_LENGTH> digest;
  SHA1(reinterpret_cast<const unsigned char*>(material.data()), material.size(), digest.data());
  return base64(digest.data(), digest.size());
}

std::string generateClientKey() {
  etl::array<unsigned char, 16> nonce;
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    for (size_t i = 0; i < nonce.size(); ++i) {
      nonce[i] = static_cast<unsigned char>(rand() & 0xFF);
    }
  }
  return base64(nonce.data(), nonce.size());
}

std::string channelPath(const std::string& channel) {
  if (channel.empty()) {
    return "/";
  }
  return channel[0] == '/' ? channel : "/" + channel;
}

std::string buildUpgradeRequest(const std::string& host, uint16_t port,
                                const std::string& path, const std::string& key) {
  std::string out;
  out += "GET " + path + " HTTP/1.1\r\n";
  out += "Host: " + host + ":" + std::to_string(port) + "\r\n";
  out += "Upgrade: websocket\r\n";
  out += "Connection: Upgrade\r\n";
  out += "Sec-WebSocket-Key: " + key + "\r\n";
  out += "Sec-WebSocket-Version: 13\r\n";
  out += "\r\n";
  return out;
}

std::string buildUpgradeResponse(const std::string& accept_key) {
  std::string out;
  out += "HTTP/1.1 101 Switching Protocols\r\n";
  out += "Upgrade: websocket\r\n";
  out += "Connection: Upgrade\r\n";
  out += "Sec-WebSocket-Accept: " + accept_key + "\r\n";
  out += "\r\n";
  return out;
}

std::string buildHealthResponse(const std::string& version) {
  const std::string body = "{\"status\":\"ok\",\"version\":\"" + version + "\"}";
  std::string out;
  out += "HTTP/1.1 200 OK\r\n";
  out += "Content-Type: application/json\r\n";
  out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  out += "Connection: close\r\n";
  out += "\r\n";
  out += body;
  return out;
}

std::string buildConflictResponse() {
  return "HTTP/1.1 409 Conflict\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
}

std::string buildNotFoundResponse() {
  return "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
}

bool validateUpgradeResponse(const HttpResponse& response, const std::string& client_key) {
  if (response.status != 101) {
    return false;
  }
  if (!scenelink::util::equalsIgnoreCase(response.header("upgrade"), "websocket")) {
    return false;
  }
  return response.header("sec-websocket-accept") == computeAcceptKey(client_key);
}

}  // namespace ws
}  // namespace rpc
