/*
 * AgentHost - runs an editor instance with the SceneLink Agent attached.
 *
 * Usage: scenelink_agent_host [--project DIR] [--descriptor FILE]
 *                             [--port N] [--channel NAME] [--debug]
 *
 * The descriptor (normally the provisioned SceneLinkAgent.plugin) supplies
 * the [agent] defaults; flags override it. SIGHUP simulates a domain reload,
 * SIGINT/SIGTERM stop the host.
 */
#include <errno.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <chrono>
#include <string>
#include <thread>

#include <SceneLink.h>

#include "util/file_utils.h"

using namespace scenelink;

namespace {

volatile sig_atomic_t g_stop = 0;
volatile sig_atomic_t g_reload = 0;

void handleStop(int) { g_stop = 1; }
void handleReload(int) { g_reload = 1; }

// Frame period of the simulated editor main loop.
constexpr int kFrameMs = 16;

void printUsage(const char* argv0) {
  fprintf(stderr,
          "usage: %s [--project DIR] [--descriptor FILE] [--port N] [--channel NAME] [--debug]\n",
          argv0);
}

}  // namespace

int main(int argc, char** argv) {
  std::string project = ".";
  std::string descriptor;
  std::string port_arg;
  std::string channel_arg;
  bool channel_given = false;
  bool debug = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = (i + 1 < argc);
    if (arg == "--project" && has_value) {
      project = argv[++i];
    } else if (arg == "--descriptor" && has_value) {
      descriptor = argv[++i];
    } else if (arg == "--port" && has_value) {
      port_arg = argv[++i];
    } else if (arg == "--channel" && has_value) {
      channel_arg = argv[++i];
      channel_given = true;
    } else if (arg == "--debug") {
      debug = true;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  log::init(debug ? spdlog::level::debug : spdlog::level::info);

  AgentConfig config;
  config.project_root = project;
  if (descriptor.empty()) {
    PluginInstaller installer;
    const std::string installed = installer.installPath(project);
    if (util::fileExists(installed)) {
      descriptor = installed;
    }
  }
  if (!descriptor.empty()) {
    std::string text;
    if (!util::readFile(descriptor, text)) {
      log::get()->error("cannot read descriptor {}: {}", descriptor, strerror(errno));
      return 1;
    }
    if (!parseAgentDescriptor(text, config)) {
      log::get()->error("malformed [agent] section in {}", descriptor);
      return 1;
    }
  }
  if (!port_arg.empty()) {
    AgentConfig overridden = config;
    if (!parseAgentDescriptor("[agent]\nport = " + port_arg + "\n", overridden)) {
      log::get()->error("invalid port: {}", port_arg);
      return 2;
    }
    config = overridden;
  }
  if (channel_given) {
    config.channel = channel_arg;
  }

  signal(SIGINT, handleStop);
  signal(SIGTERM, handleStop);
  signal(SIGHUP, handleReload);

  util::SystemClock clock;
  editor::EditorApplication app(project);
  BridgeAgent agent(config, app, clock);
  if (!agent.begin()) {
    return 1;
  }
  app.log(rpc::LogType::LOG, "SceneLink agent host ready on port " + std::to_string(agent.port()));

  while (!g_stop) {
    if (g_reload) {
      g_reload = 0;
      agent.onBeforeReload();
      agent.onAfterReload();
    }
    agent.update();
    std::this_thread::sleep_for(std::chrono::milliseconds(kFrameMs));
  }

  agent.end();
  return 0;
}
