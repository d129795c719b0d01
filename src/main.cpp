#include <csignal>
#include <iostream>
#include <sstream>
#include <string>

#include "core/agent.hpp"
#include "core/config.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

}  // namespace

std::string format_config_settings(const activity_agent::core::AgentConfig& config, const std::string& config_path) {
  std::size_t enabled_sources = 0;
  for (const auto& [id, source] : config.sources) {
    (void)id;
    if (source.enabled) {
      ++enabled_sources;
    }
  }

  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | tick_interval_ms=" << config.tick_interval.count()
         << " | sources=" << enabled_sources
         << " | publish_health=" << (config.publish_health ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | diagnostics=" << (config.diagnostics_path.empty() ? "off" : config.diagnostics_path)
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  // Probe subprocesses may close their pipe early.
  std::signal(SIGPIPE, SIG_IGN);

  const std::string config_path = argc > 1 ? argv[1] : "configs/agent.example.yaml";

  activity_agent::core::AgentConfig config{};
  try {
    config = activity_agent::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  try {
    activity_agent::core::Agent agent{config};
    while (g_shutdown_requested == 0) {
      agent.run_for_ticks(1);
    }
  } catch (const std::exception& ex) {
    std::cerr << "agent error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";

  return 0;
}
