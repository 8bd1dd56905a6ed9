/*
 * BridgeCtl - one-shot Controller for a running SceneLink Agent.
 *
 * Usage: scenelink_ctl [--project DIR] [--wait MS] [--no-provision] [--debug]
 *                      <category> <action> [key=value ...]
 *        scenelink_ctl [--project DIR] --watch
 *
 * Connects through the discovery record, sends one command and prints the
 * result as JSON. --watch prints console and play-mode events until Ctrl-C.
 */
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <SceneLink.h>

using namespace scenelink;

namespace {

volatile sig_atomic_t g_stop = 0;

void handleStop(int) { g_stop = 1; }

constexpr int kLoopMs = 10;
constexpr uint32_t kDefaultWaitMs = 15000;

void printUsage(const char* argv0) {
  fprintf(stderr,
          "usage: %s [--project DIR] [--wait MS] [--no-provision] [--debug] "
          "<category> <action> [key=value ...]\n"
          "       %s [--project DIR] --watch\n",
          argv0, argv0);
}

// Runs the controller until pred() holds, the deadline passes or a signal
// arrives.
template <typename Pred>
bool pumpUntil(BridgeController& controller, util::Clock& clock, uint32_t budget_ms, Pred pred) {
  const uint32_t started = clock.millis();
  while (!g_stop) {
    controller.process();
    if (pred()) {
      return true;
    }
    if (budget_ms > 0 && clock.millis() - started >= budget_ms) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(kLoopMs));
  }
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  ControllerConfig config;
  uint32_t wait_ms = kDefaultWaitMs;
  bool watch = false;
  bool debug = false;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = (i + 1 < argc);
    if (arg == "--project" && has_value) {
      config.project_root = argv[++i];
    } else if (arg == "--wait" && has_value) {
      wait_ms = static_cast<uint32_t>(strtoul(argv[++i], nullptr, 10));
    } else if (arg == "--no-provision") {
      config.auto_provision = false;
    } else if (arg == "--watch") {
      watch = true;
    } else if (arg == "--debug") {
      debug = true;
    } else if (!arg.empty() && arg[0] == '-') {
      printUsage(argv[0]);
      return 2;
    } else {
      positional.push_back(arg);
    }
  }
  if (!watch && positional.size() < 2) {
    printUsage(argv[0]);
    return 2;
  }

  rpc::ParamMap params;
  for (size_t i = 2; i < positional.size(); ++i) {
    const size_t eq = positional[i].find('=');
    if (eq == std::string::npos || eq == 0) {
      fprintf(stderr, "parameter must be key=value: %s\n", positional[i].c_str());
      return 2;
    }
    params[positional[i].substr(0, eq)] = positional[i].substr(eq + 1);
  }

  log::init(debug ? spdlog::level::debug : spdlog::level::warn);
  signal(SIGINT, handleStop);
  signal(SIGTERM, handleStop);

  util::SystemClock clock;
  BridgeController controller(config, clock);
  controller.onConsoleLog([](const rpc::ConsoleLogEvent& entry) {
    printf("[%s] %s\n", rpc::toString(entry.log_type), entry.message.c_str());
    fflush(stdout);
  });
  controller.onPlayModeChanged([](rpc::PlayModeState state) {
    printf("play mode: %s\n", rpc::toString(state));
    fflush(stdout);
  });
  controller.onConnectionStateChanged([debug](fsm::StateId state) {
    if (debug) {
      fprintf(stderr, "connection: %s\n", fsm::stateName(state));
    }
  });
  controller.begin();

  if (!pumpUntil(controller, clock, watch ? 0 : wait_ms,
                 [&controller]() { return controller.isConnected(); })) {
    if (!g_stop) {
      fprintf(stderr, "no editor agent found under %s\n", config.project_root.c_str());
    }
    controller.end();
    return 1;
  }

  if (watch) {
    // Keeps reconnecting across domain reloads until interrupted.
    (void)pumpUntil(controller, clock, 0, []() { return false; });
    controller.end();
    return 0;
  }

  bool done = false;
  int exit_code = 1;
  etl::expected<std::string, SendError> sent = controller.sendCommand(
      positional[0], positional[1], params,
      [&done, &exit_code](const controller::CommandOutcome& outcome) {
        done = true;
        if (outcome.ok()) {
          Json::StreamWriterBuilder writer;
          writer["indentation"] = "  ";
          printf("%s\n", Json::writeString(writer, outcome.response.result).c_str());
          exit_code = 0;
        } else {
          fprintf(stderr, "%s: %s\n", controller::toString(outcome.status),
                  outcome.response.error.c_str());
        }
      });
  if (!sent.has_value()) {
    fprintf(stderr, "%s\n", toString(sent.error()));
    controller.end();
    return 1;
  }
  (void)pumpUntil(controller, clock, 0, [&done]() { return done; });
  controller.end();
  return exit_code;
}
