/**
 * @file discovery_record.h
 * @brief On-disk rendezvous record advertising a running Agent.
 *
 * The Agent writes the record when it starts listening and deletes it on a
 * clean shutdown. The Controller only reads it, and deletes it when it is
 * older than the stale threshold.
 */
#ifndef RPC_DISCOVERY_RECORD_H
#define RPC_DISCOVERY_RECORD_H

#include <stdint.h>

#include <string>

#include "etl/expected.h"

namespace rpc {

struct DiscoveryRecord {
  uint16_t port;
  int32_t pid;
  std::string version;
  std::string channel;  // empty on protocol 1.0
  int64_t timestamp;    // unix seconds

  DiscoveryRecord() : port(0), pid(0), timestamp(0) {}
};

enum class DiscoveryError : uint8_t {
  NOT_FOUND,
  UNREADABLE,
  MALFORMED
};

const char* toString(DiscoveryError error);

// <project_root>/Library/SceneLink/bridge.json
std::string discoveryPath(const std::string& project_root);

std::string serializeDiscoveryRecord(const DiscoveryRecord& record);

// port (1..65535) and version are required; pid and timestamp default to 0.
etl::expected<DiscoveryRecord, DiscoveryError> parseDiscoveryRecord(const std::string& text);

etl::expected<DiscoveryRecord, DiscoveryError> readDiscoveryRecord(const std::string& path);
bool writeDiscoveryRecord(const std::string& path, const DiscoveryRecord& record);
bool removeDiscoveryRecord(const std::string& path);

inline bool isStale(const DiscoveryRecord& record, int64_t now_seconds, uint32_t threshold_seconds) {
  return (now_seconds - record.timestamp) > static_cast<int64_t>(threshold_seconds);
}

}  // namespace rpc

#endif  // RPC_DISCOVERY_RECORD_H
