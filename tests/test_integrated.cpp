#include <stdio.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "BridgeAgent.h"
#include "BridgeController.h"
#include "editor/editor_application.h"
#include "mocks/RawClient.h"
#include "test_support.h"
#include "util/clock.h"
#include "util/file_utils.h"

using namespace scenelink;

namespace {

// Both halves in one process over real loopback sockets.
struct Rig {
  TempProject project;
  util::SystemClock clock;
  editor::EditorApplication app;
  BridgeAgent agent;
  BridgeController controller;

  Rig()
    : app(project.root())
    , agent(agentConfig(project), app, clock)
    , controller(controllerConfig(project), clock)
  {
  }

  static AgentConfig agentConfig(const TempProject& project) {
    AgentConfig config;
    config.project_root = project.root();
    return config;
  }

  static ControllerConfig controllerConfig(const TempProject& project) {
    ControllerConfig config;
    config.project_root = project.root();
    config.reconnect_delay_ms = 100;
    config.command_timeout_ms = 3000;
    return config;
  }

  void tick() {
    controller.process();
    agent.update();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  // Ticks both sides until cond holds; false after five seconds.
  template <typename Cond>
  bool pumpUntil(Cond cond) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
      if (cond()) {
        return true;
      }
      tick();
    }
    return cond();
  }

  bool connect() {
    if (!agent.begin()) {
      return false;
    }
    controller.begin();
    return pumpUntil([this]() { return controller.isConnected(); });
  }
};

struct Capture {
  bool done;
  controller::CommandOutcome outcome;

  Capture() : done(false) {}

  controller::ResponseHandler handler() {
    return [this](const controller::CommandOutcome& o) {
      done = true;
      outcome = o;
    };
  }
};

}  // namespace

static void test_connect_and_command_round_trip() {
  Rig rig;
  TEST_ASSERT(rig.connect());
  TEST_ASSERT_EQ_UINT(rig.controller.lastRecord().port, rig.agent.port());
  TEST_ASSERT(rig.controller.provisioningResult() == InstallResult::INSTALLED);
  TEST_ASSERT(util::fileExists(PluginInstaller().installPath(rig.project.root())));

  Capture created;
  TEST_ASSERT(rig.controller.createPrimitive("Player", "Capsule", "", created.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&created]() { return created.done; }));
  TEST_ASSERT(created.outcome.ok());
  TEST_ASSERT_EQ_STR(created.outcome.response.result["name"].asString(), "Player");

  Capture moved;
  TEST_ASSERT(rig.controller.setTransform("Player", {0, 1, 0}, {}, {}, moved.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&moved]() { return moved.done; }));
  TEST_ASSERT(moved.outcome.ok());
  TEST_ASSERT_NEAR(rig.app.activeScene().find("Player")->localPosition().y, 1.0, 1e-6);

  Capture missing;
  TEST_ASSERT(rig.controller.setComponentProperty("Player", "Rigidbody", "mass", "2",
                                                  missing.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&missing]() { return missing.done; }));
  TEST_ASSERT(missing.outcome.status == controller::CommandStatus::COMPLETED);
  TEST_ASSERT(!missing.outcome.response.success);
  TEST_ASSERT_EQ_STR(missing.outcome.response.error, "Component not found: Rigidbody on Player");

  Capture unknown;
  TEST_ASSERT(rig.controller.sendCommand("x", "y", rpc::ParamMap(), unknown.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&unknown]() { return unknown.done; }));
  TEST_ASSERT_EQ_STR(unknown.outcome.response.error, "Unknown command: x.y");
  TEST_ASSERT_EQ_UINT(rig.controller.pendingCount(), 0);

  rig.controller.end();
  rig.agent.end();
  TEST_CASE_OK("connect_and_command_round_trip");
}

static void test_second_client_rejected_and_health() {
  Rig rig;
  TEST_ASSERT(rig.connect());

  RawClient intruder(rig.agent.port());
  TEST_ASSERT(intruder.connected());
  rpc::ws::HttpResponse response;
  TEST_ASSERT(intruder.upgrade("/", response));
  TEST_ASSERT_EQ_UINT(response.status, 409);

  RawClient checker(rig.agent.port());
  TEST_ASSERT(checker.connected());
  TEST_ASSERT(checker.send("GET / HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n"));
  TEST_ASSERT(checker.readToClose().find("HTTP/1.1 200") == 0);

  // The Controller's session is unaffected.
  Capture state;
  TEST_ASSERT(rig.controller.getPlayModeState(state.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&state]() { return state.done; }));
  TEST_ASSERT(state.outcome.ok());

  rig.controller.end();
  rig.agent.end();
  TEST_CASE_OK("second_client_rejected_and_health");
}

static void test_events_reach_controller() {
  Rig rig;
  std::vector<rpc::ConsoleLogEvent> logs;
  std::vector<rpc::PlayModeState> modes;
  rig.controller.onConsoleLog([&logs](const rpc::ConsoleLogEvent& e) { logs.push_back(e); });
  rig.controller.onPlayModeChanged([&modes](rpc::PlayModeState s) { modes.push_back(s); });
  TEST_ASSERT(rig.connect());

  rig.app.log(rpc::LogType::ERROR, "NullReference in Player.Update", "Player.cs:42");
  TEST_ASSERT(rig.pumpUntil([&logs]() { return !logs.empty(); }));
  TEST_ASSERT_EQ_STR(logs[0].message, "NullReference in Player.Update");
  TEST_ASSERT(logs[0].log_type == rpc::LogType::ERROR);

  Capture play;
  TEST_ASSERT(rig.controller.sendCommand("editor", "play", rpc::ParamMap(), play.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&]() { return play.done && !modes.empty(); }));
  TEST_ASSERT(modes.back() == rpc::PlayModeState::PLAYING);
  TEST_ASSERT(rig.controller.lastPlayModeState() == rpc::PlayModeState::PLAYING);

  rig.controller.end();
  rig.agent.end();
  TEST_CASE_OK("events_reach_controller");
}

static void test_reconnects_after_agent_reload() {
  Rig rig;
  TEST_ASSERT(rig.connect());
  const uint16_t first_port = rig.agent.port();

  // A command in flight when the Agent goes away is rejected, not lost.
  Capture stranded;
  TEST_ASSERT(rig.controller.getSceneHierarchy(stranded.handler()).has_value());
  rig.agent.onBeforeReload();
  TEST_ASSERT(rig.pumpUntil([&rig]() { return !rig.controller.isConnected(); }));
  TEST_ASSERT(stranded.done);
  TEST_ASSERT(stranded.outcome.status == controller::CommandStatus::CONNECTION_CLOSED);

  rig.agent.onAfterReload();
  TEST_ASSERT(rig.agent.isRunning());
  TEST_ASSERT(rig.pumpUntil([&rig]() { return rig.controller.isConnected(); }));
  TEST_ASSERT_EQ_UINT(rig.controller.lastRecord().port, rig.agent.port());
  TEST_ASSERT(first_port != 0);

  Capture after;
  TEST_ASSERT(rig.controller.getSceneHierarchy(after.handler()).has_value());
  TEST_ASSERT(rig.pumpUntil([&after]() { return after.done; }));
  TEST_ASSERT(after.outcome.ok());
  TEST_ASSERT_EQ_UINT(after.outcome.response.result["hierarchy"].size(), 2);

  rig.controller.end();
  rig.agent.end();
  TEST_CASE_OK("reconnects_after_agent_reload");
}

int main() {
  printf("test_integrated\n");
  test_connect_and_command_round_trip();
  test_second_client_rejected_and_health();
  test_events_reach_controller();
  test_reconnects_after_agent_reload();
  return 0;
}
