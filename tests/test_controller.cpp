#include <stdio.h>

#include <string>
#include <vector>

#include "BridgeController.h"
#include "mocks/FakeChannel.h"
#include "mocks/ManualClock.h"
#include "protocol/bridge_message.h"
#include "protocol/discovery_record.h"
#include "test_support.h"
#include "util/file_utils.h"

using namespace scenelink;

namespace {

struct OutcomeLog {
  int calls;
  controller::CommandOutcome last;

  OutcomeLog() : calls(0) { last.status = controller::CommandStatus::COMPLETED; }

  controller::ResponseHandler handler() {
    return [this](const controller::CommandOutcome& outcome) {
      ++calls;
      last = outcome;
    };
  }
};

void writeRecord(const TempProject& project, const ManualClock& clock, uint16_t port,
                 const std::string& version = "1.0", const std::string& channel = "") {
  rpc::DiscoveryRecord record;
  record.port = port;
  record.pid = 99;
  record.version = version;
  record.channel = channel;
  record.timestamp = clock.unixSeconds();
  TEST_ASSERT(rpc::writeDiscoveryRecord(rpc::discoveryPath(project.root()), record));
}

ControllerConfig testConfig(const TempProject& project) {
  ControllerConfig config;
  config.project_root = project.root();
  config.auto_provision = false;
  return config;
}

// Runs process() in 1 s steps, the largest step the timer service accepts.
void runFor(BridgeController& controller, ManualClock& clock, uint32_t ms) {
  while (ms > 0) {
    const uint32_t step = ms > 1000 ? 1000 : ms;
    clock.advanceMs(step);
    controller.process();
    ms -= step;
  }
}

void injectResponse(FakeChannelState& channel, const rpc::Response& response) {
  channel.inbound.push_back(rpc::encode(response));
}

}  // namespace

static void test_connects_through_discovery() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  std::vector<fsm::StateId> states;
  controller.onConnectionStateChanged([&states](fsm::StateId s) { states.push_back(s); });

  writeRecord(project, clock, 52000, "1.1", "abc");
  controller.begin();
  TEST_ASSERT(controller.state() == fsm::STATE_CONNECTING);
  controller.process();
  TEST_ASSERT(controller.isConnected());
  TEST_ASSERT(!controller.isPolling());
  TEST_ASSERT_EQ_UINT(channel.last_port, 52000);
  TEST_ASSERT_EQ_STR(channel.last_path, "/abc");
  TEST_ASSERT_EQ_UINT(states.size(), 2);
  TEST_ASSERT(states[0] == fsm::STATE_CONNECTING);
  TEST_ASSERT(states[1] == fsm::STATE_CONNECTED);
  TEST_CASE_OK("connects_through_discovery");
}

static void test_no_record_keeps_polling() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  controller.begin();
  runFor(controller, clock, 12000);
  TEST_ASSERT(controller.state() == fsm::STATE_DISCONNECTED);
  TEST_ASSERT(controller.isPolling());
  TEST_ASSERT_EQ_UINT(channel.opened, 0);

  writeRecord(project, clock, 52001);
  runFor(controller, clock, 5000);
  TEST_ASSERT_EQ_UINT(channel.opened, 1);
  TEST_CASE_OK("no_record_keeps_polling");
}

static void test_stale_record_is_removed_before_connecting() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  rpc::DiscoveryRecord record;
  record.port = 52002;
  record.version = "1.0";
  record.timestamp = clock.unixSeconds() - 120;
  TEST_ASSERT(rpc::writeDiscoveryRecord(controller.discoveryPath(), record));

  controller.begin();
  TEST_ASSERT(controller.state() == fsm::STATE_DISCONNECTED);
  TEST_ASSERT(!util::fileExists(controller.discoveryPath()));
  TEST_ASSERT_EQ_UINT(channel.opened, 0);
  TEST_CASE_OK("stale_record_is_removed_before_connecting");
}

static void test_response_resolves_pending_request() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52003);
  controller.begin();
  controller.process();

  OutcomeLog log;
  auto sent = controller.createPrimitive("Player", "Capsule", "", log.handler());
  TEST_ASSERT(sent.has_value());
  TEST_ASSERT_EQ_UINT(controller.pendingCount(), 1);
  TEST_ASSERT_EQ_UINT(channel.sent.size(), 1);
  auto request = rpc::decodeMessage(channel.sent[0]);
  TEST_ASSERT(request.has_value());
  TEST_ASSERT_EQ_STR(request.value().request.key(), "gameObject.createPrimitive");
  TEST_ASSERT_EQ_STR(request.value().request.params.at("primitiveType"), "Capsule");
  TEST_ASSERT(request.value().request.params.count("parentPath") == 0);

  Json::Value result(Json::objectValue);
  result["name"] = "Player";
  injectResponse(channel, rpc::Response::ok(sent.value(), result));
  // Unknown ids are dropped without touching other entries.
  injectResponse(channel, rpc::Response::ok("not-pending", result));
  controller.process();
  TEST_ASSERT_EQ_UINT(log.calls, 1);
  TEST_ASSERT(log.last.ok());
  TEST_ASSERT_EQ_STR(log.last.response.result["name"].asString(), "Player");
  TEST_ASSERT_EQ_UINT(controller.pendingCount(), 0);
  TEST_CASE_OK("response_resolves_pending_request");
}

static void test_set_transform_formats_vectors() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52004);
  controller.begin();
  controller.process();

  OutcomeLog log;
  std::vector<double> position;
  position.push_back(0);
  position.push_back(1.5);
  position.push_back(-2);
  TEST_ASSERT(controller.setTransform("Player", position, std::vector<double>(),
                                      std::vector<double>(), log.handler()).has_value());
  auto request = rpc::decodeMessage(channel.sent.back());
  TEST_ASSERT(request.has_value());
  TEST_ASSERT_EQ_STR(request.value().request.params.at("position"), "[0,1.5,-2]");
  TEST_ASSERT(request.value().request.params.count("rotation") == 0);
  TEST_CASE_OK("set_transform_formats_vectors");
}

static void test_timeout_and_late_response_never_both() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  ControllerConfig config = testConfig(project);
  config.command_timeout_ms = 500;
  BridgeController controller(config, clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52005);
  controller.begin();
  controller.process();

  OutcomeLog log;
  auto sent = controller.sendCommand("scene", "getActive", rpc::ParamMap(), log.handler());
  TEST_ASSERT(sent.has_value());
  runFor(controller, clock, 499);
  TEST_ASSERT_EQ_UINT(log.calls, 0);
  runFor(controller, clock, 2);
  TEST_ASSERT_EQ_UINT(log.calls, 1);
  TEST_ASSERT(log.last.status == controller::CommandStatus::TIMEOUT);
  TEST_ASSERT_EQ_STR(log.last.response.error, "Command timeout: scene.getActive");

  injectResponse(channel, rpc::Response::ok(sent.value(), Json::Value(Json::objectValue)));
  controller.process();
  TEST_ASSERT_EQ_UINT(log.calls, 1);
  TEST_ASSERT(controller.isConnected());
  TEST_CASE_OK("timeout_and_late_response_never_both");
}

static void test_close_rejects_every_pending_request() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52006);
  controller.begin();
  controller.process();

  OutcomeLog first;
  OutcomeLog second;
  TEST_ASSERT(controller.getSceneHierarchy(first.handler()).has_value());
  TEST_ASSERT(controller.getPlayModeState(second.handler()).has_value());
  channel.status = transport::ChannelStatus::CLOSED;
  controller.process();

  TEST_ASSERT_EQ_UINT(first.calls, 1);
  TEST_ASSERT_EQ_UINT(second.calls, 1);
  TEST_ASSERT(first.last.status == controller::CommandStatus::CONNECTION_CLOSED);
  TEST_ASSERT_EQ_STR(second.last.response.error, "Connection closed");
  TEST_ASSERT(controller.state() == fsm::STATE_RECONNECTING);
  TEST_ASSERT_EQ_UINT(controller.reconnectAttempts(), 1);
  TEST_ASSERT_EQ_UINT(controller.pendingCount(), 0);
  TEST_CASE_OK("close_rejects_every_pending_request");
}

static void test_reconnect_rereads_record_after_reload() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52007);
  controller.begin();
  controller.process();
  channel.status = transport::ChannelStatus::CLOSED;
  controller.process();
  TEST_ASSERT(controller.state() == fsm::STATE_RECONNECTING);

  // The engine came back on a new port.
  writeRecord(project, clock, 52008);
  runFor(controller, clock, 3000);
  controller.process();
  TEST_ASSERT(controller.isConnected());
  TEST_ASSERT_EQ_UINT(channel.last_port, 52008);
  TEST_ASSERT_EQ_UINT(controller.reconnectAttempts(), 0);
  TEST_CASE_OK("reconnect_rereads_record_after_reload");
}

static void test_reconnect_budget_is_bounded() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  std::vector<fsm::StateId> states;
  controller.onConnectionStateChanged([&states](fsm::StateId s) { states.push_back(s); });
  writeRecord(project, clock, 52009);
  controller.begin();
  controller.process();

  TEST_ASSERT(rpc::removeDiscoveryRecord(controller.discoveryPath()));
  channel.status = transport::ChannelStatus::CLOSED;
  controller.process();

  uint8_t max_attempts = 0;
  for (int i = 0; i < 30 && controller.state() != fsm::STATE_DISCONNECTED; ++i) {
    if (controller.reconnectAttempts() > max_attempts) {
      max_attempts = controller.reconnectAttempts();
    }
    runFor(controller, clock, 1000);
  }
  TEST_ASSERT(controller.state() == fsm::STATE_DISCONNECTED);
  TEST_ASSERT_EQ_UINT(max_attempts, config::kMaxReconnectAttempts);
  TEST_ASSERT_EQ_UINT(controller.reconnectAttempts(), 0);
  TEST_ASSERT(controller.isPolling());
  TEST_ASSERT(states.back() == fsm::STATE_DISCONNECTED);
  TEST_ASSERT_EQ_UINT(channel.opened, 1);
  TEST_CASE_OK("reconnect_budget_is_bounded");
}

static void test_retry_now_resets_counter() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52010);
  controller.begin();
  controller.process();
  channel.status = transport::ChannelStatus::CLOSED;
  controller.process();
  TEST_ASSERT_EQ_UINT(controller.reconnectAttempts(), 1);

  controller.retryNow();
  TEST_ASSERT_EQ_UINT(controller.reconnectAttempts(), 0);
  TEST_ASSERT(controller.state() == fsm::STATE_CONNECTING);
  controller.process();
  TEST_ASSERT(controller.isConnected());

  // Ignored while connected.
  const int opened = channel.opened;
  controller.retryNow();
  TEST_ASSERT(controller.isConnected());
  TEST_ASSERT_EQ_UINT(channel.opened, opened);
  TEST_CASE_OK("retry_now_resets_counter");
}

static void test_handshake_timeout_falls_back_to_fast_repoll() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  channel.open_on_poll = false;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52011);
  controller.begin();
  TEST_ASSERT(controller.state() == fsm::STATE_CONNECTING);

  runFor(controller, clock, config::kHandshakeTimeoutMs);
  TEST_ASSERT(controller.state() == fsm::STATE_DISCONNECTED);
  TEST_ASSERT_EQ_UINT(channel.close_code, rpc::RPC_CLOSE_NORMAL);

  writeRecord(project, clock, 52011);
  runFor(controller, clock, config::kFastRepollMs);
  TEST_ASSERT_EQ_UINT(channel.opened, 2);
  TEST_ASSERT(controller.state() == fsm::STATE_CONNECTING);
  TEST_CASE_OK("handshake_timeout_falls_back_to_fast_repoll");
}

static void test_disconnect_cancels_and_stops_polling() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  writeRecord(project, clock, 52012);
  controller.begin();
  controller.process();

  OutcomeLog log;
  TEST_ASSERT(controller.getSelectedObjects(log.handler()).has_value());
  controller.disconnect();
  TEST_ASSERT_EQ_UINT(log.calls, 1);
  TEST_ASSERT(log.last.status == controller::CommandStatus::CANCELLED);
  TEST_ASSERT_EQ_STR(log.last.response.error, "Disconnected by user");
  TEST_ASSERT_EQ_UINT(channel.close_code, rpc::RPC_CLOSE_NORMAL);
  TEST_ASSERT(controller.state() == fsm::STATE_DISCONNECTED);
  TEST_ASSERT(!controller.isPolling());

  runFor(controller, clock, 20000);
  TEST_ASSERT_EQ_UINT(channel.opened, 1);
  TEST_CASE_OK("disconnect_cancels_and_stops_polling");
}

static void test_send_errors() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  OutcomeLog log;
  auto offline = controller.sendCommand("scene", "getActive", rpc::ParamMap(), log.handler());
  TEST_ASSERT(!offline.has_value());
  TEST_ASSERT(offline.error() == SendError::NOT_CONNECTED);

  writeRecord(project, clock, 52013);
  controller.begin();
  controller.process();
  channel.fail_send = true;
  auto failed = controller.sendCommand("scene", "getActive", rpc::ParamMap(), log.handler());
  TEST_ASSERT(!failed.has_value());
  TEST_ASSERT(failed.error() == SendError::TRANSMIT_FAILED);
  TEST_ASSERT_EQ_UINT(controller.pendingCount(), 0);
  TEST_ASSERT_EQ_UINT(log.calls, 0);
  TEST_CASE_OK("send_errors");
}

static void test_events_and_malformed_frames() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  std::vector<std::string> console;
  std::vector<rpc::PlayModeState> modes;
  controller.onConsoleLog([&console](const rpc::ConsoleLogEvent& e) { console.push_back(e.message); });
  controller.onPlayModeChanged([&modes](rpc::PlayModeState s) { modes.push_back(s); });
  writeRecord(project, clock, 52014);
  controller.begin();
  controller.process();

  rpc::ConsoleLogEvent entry;
  entry.message = "Hello from the editor";
  channel.inbound.push_back("{{{ not json");
  channel.inbound.push_back(rpc::encode(rpc::makeConsoleLogEvent(entry)));
  channel.inbound.push_back(rpc::encode(rpc::makePlayModeChangedEvent(rpc::PlayModeState::PLAYING)));
  controller.process();

  TEST_ASSERT(controller.isConnected());
  TEST_ASSERT_EQ_UINT(console.size(), 1);
  TEST_ASSERT_EQ_STR(console[0], "Hello from the editor");
  TEST_ASSERT_EQ_UINT(modes.size(), 1);
  TEST_ASSERT(controller.lastPlayModeState() == rpc::PlayModeState::PLAYING);

  // A timestamp no int64 can hold is dropped to 0; the event still arrives.
  channel.inbound.push_back(
      "{\"id\":\"e1\",\"type\":\"event\",\"event\":\"console.log\","
      "\"data\":{\"message\":\"hi\",\"timestamp\":1e30}}");
  controller.process();
  TEST_ASSERT(controller.isConnected());
  TEST_ASSERT_EQ_UINT(console.size(), 2);
  TEST_ASSERT_EQ_STR(console[1], "hi");
  TEST_CASE_OK("events_and_malformed_frames");
}

static void test_destruction_cancels_pending_requests() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  OutcomeLog log;
  {
    BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
    writeRecord(project, clock, 52016);
    controller.begin();
    controller.process();
    TEST_ASSERT(controller.isConnected());
    TEST_ASSERT(controller.getSceneHierarchy(log.handler()).has_value());
    TEST_ASSERT_EQ_UINT(controller.pendingCount(), 1);
  }
  TEST_ASSERT_EQ_UINT(log.calls, 1);
  TEST_ASSERT(log.last.status == controller::CommandStatus::CANCELLED);
  TEST_ASSERT_EQ_STR(log.last.response.error, rpc::RPC_ERROR_DISCONNECTED_BY_USER);
  TEST_ASSERT_EQ_UINT(channel.close_code, rpc::RPC_CLOSE_NORMAL);
  TEST_CASE_OK("destruction_cancels_pending_requests");
}

static void test_compatibility_warning_once_per_version() {
  TempProject project;
  ManualClock clock;
  FakeChannelState channel;
  BridgeController controller(testConfig(project), clock, fakeChannelFactory(channel));
  std::vector<std::string> warnings;
  controller.onCompatibilityWarning([&warnings](const std::string& v) { warnings.push_back(v); });
  writeRecord(project, clock, 52015, "2.0");
  controller.begin();
  controller.process();
  TEST_ASSERT(controller.isConnected());

  controller.disconnect();
  controller.connect();
  controller.process();
  TEST_ASSERT(controller.isConnected());
  TEST_ASSERT_EQ_UINT(warnings.size(), 1);
  TEST_ASSERT_EQ_STR(warnings[0], "2.0");
  TEST_CASE_OK("compatibility_warning_once_per_version");
}

int main() {
  test_connects_through_discovery();
  test_no_record_keeps_polling();
  test_stale_record_is_removed_before_connecting();
  test_response_resolves_pending_request();
  test_set_transform_formats_vectors();
  test_timeout_and_late_response_never_both();
  test_close_rejects_every_pending_request();
  test_reconnect_rereads_record_after_reload();
  test_reconnect_budget_is_bounded();
  test_retry_now_resets_counter();
  test_handshake_timeout_falls_back_to_fast_repoll();
  test_disconnect_cancels_and_stops_polling();
  test_send_errors();
  test_events_and_malformed_frames();
  test_destruction_cancels_pending_requests();
  test_compatibility_warning_once_per_version();
  return 0;
}
