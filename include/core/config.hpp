#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "core/source_runner.hpp"
#include "model/source.hpp"
#include "probes/factory.hpp"

namespace activity_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"activity:node"};
  bool enabled{false};
};

struct SourceConfig {
  bool enabled{true};
  SourceOptions options{};
  probes::ProbeSpec probe{};
  bool probe_configured{false};
  bool timeout_configured{false};
  // Set by any sources.<name>.* key; debug.<name> alone does not declare a source.
  bool declared{false};
};

struct AgentConfig {
  std::chrono::milliseconds tick_interval{1000};
  bool publish_health{true};
  bool stdout_debug{true};
  RedisConfig redis{};
  // Empty disables the JSON-lines diagnostic log; "-" writes to stderr.
  std::string diagnostics_path{};
  std::map<model::source_id, SourceConfig> sources{};
};

// Subprocess-backed probes get this deadline unless timeout_ms says otherwise.
inline constexpr std::chrono::milliseconds kDefaultProbeTimeout{2000};

AgentConfig load_agent_config(const std::string& path);

}  // namespace activity_agent::core
