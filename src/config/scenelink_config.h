#pragma once

// Compile-time configuration for SceneLink.
//
// These are *not* protocol constants (they do not affect the on-wire format).
// They control polling cadence, retry policy and queue sizing on both sides.
// Every value can be overridden with -D at build time; the runtime config
// structs (ControllerConfig, AgentConfig) start from these defaults.

#include <stddef.h>
#include <stdint.h>

// --- Controller: discovery and reconnection policy ---

#ifndef SCENELINK_DISCOVERY_POLL_MS
#define SCENELINK_DISCOVERY_POLL_MS 5000U
#endif

// Re-poll quickly after a failed attempt to ride through recompilation.
#ifndef SCENELINK_FAST_REPOLL_MS
#define SCENELINK_FAST_REPOLL_MS 2000U
#endif

#ifndef SCENELINK_HANDSHAKE_TIMEOUT_MS
#define SCENELINK_HANDSHAKE_TIMEOUT_MS 5000U
#endif

#ifndef SCENELINK_RECONNECT_DELAY_MS
#define SCENELINK_RECONNECT_DELAY_MS 3000U
#endif

#ifndef SCENELINK_MAX_RECONNECT_ATTEMPTS
#define SCENELINK_MAX_RECONNECT_ATTEMPTS 5U
#endif

#ifndef SCENELINK_COMMAND_TIMEOUT_MS
#define SCENELINK_COMMAND_TIMEOUT_MS 10000U
#endif

// Discovery records older than this are considered abandoned.
#ifndef SCENELINK_STALE_RECORD_SECONDS
#define SCENELINK_STALE_RECORD_SECONDS 60U
#endif

// Upper bound for a single process() timer step.
#ifndef SCENELINK_MAX_TICK_DELTA_MS
#define SCENELINK_MAX_TICK_DELTA_MS 1000U
#endif

// --- Agent: threading and queue sizing ---

#ifndef SCENELINK_AGENT_BATCH_SIZE
#define SCENELINK_AGENT_BATCH_SIZE 10U
#endif

#ifndef SCENELINK_INBOUND_QUEUE_SIZE
#define SCENELINK_INBOUND_QUEUE_SIZE 64U
#endif

#ifndef SCENELINK_RECEIVE_POLL_MS
#define SCENELINK_RECEIVE_POLL_MS 8U
#endif

#ifndef SCENELINK_SEND_POLL_MS
#define SCENELINK_SEND_POLL_MS 16U
#endif

// The Agent rewrites its discovery record on this cadence so a long-lived
// editor session never looks stale to a late Controller.
#ifndef SCENELINK_DISCOVERY_REFRESH_SECONDS
#define SCENELINK_DISCOVERY_REFRESH_SECONDS 20U
#endif

#ifndef SCENELINK_MAX_MESSAGE_BYTES
#define SCENELINK_MAX_MESSAGE_BYTES (16UL * 1024UL * 1024UL)
#endif

#ifndef SCENELINK_ASSET_FIND_LIMIT
#define SCENELINK_ASSET_FIND_LIMIT 50U
#endif

namespace scenelink {
namespace config {

constexpr uint32_t kDiscoveryPollMs = SCENELINK_DISCOVERY_POLL_MS;
constexpr uint32_t kFastRepollMs = SCENELINK_FAST_REPOLL_MS;
constexpr uint32_t kHandshakeTimeoutMs = SCENELINK_HANDSHAKE_TIMEOUT_MS;
constexpr uint32_t kReconnectDelayMs = SCENELINK_RECONNECT_DELAY_MS;
constexpr uint8_t kMaxReconnectAttempts = SCENELINK_MAX_RECONNECT_ATTEMPTS;
constexpr uint32_t kCommandTimeoutMs = SCENELINK_COMMAND_TIMEOUT_MS;
constexpr uint32_t kStaleRecordSeconds = SCENELINK_STALE_RECORD_SECONDS;
constexpr uint32_t kMaxTickDeltaMs = SCENELINK_MAX_TICK_DELTA_MS;

constexpr size_t kAgentBatchSize = SCENELINK_AGENT_BATCH_SIZE;
constexpr size_t kInboundQueueSize = SCENELINK_INBOUND_QUEUE_SIZE;
constexpr uint32_t kReceivePollMs = SCENELINK_RECEIVE_POLL_MS;
constexpr uint32_t kSendPollMs = SCENELINK_SEND_POLL_MS;
constexpr uint32_t kDiscoveryRefreshSeconds = SCENELINK_DISCOVERY_REFRESH_SECONDS;
constexpr size_t kMaxMessageBytes = SCENELINK_MAX_MESSAGE_BYTES;
constexpr size_t kAssetFindLimit = SCENELINK_ASSET_FIND_LIMIT;

static_assert(kMaxReconnectAttempts > 0, "reconnect budget must be at least one attempt");
static_assert(kAgentBatchSize > 0 && kAgentBatchSize <= kInboundQueueSize,
              "agent batch must fit the inbound queue");

}  // namespace config
}  // namespace scenelink
