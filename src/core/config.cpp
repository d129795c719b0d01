#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace activity_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::uint32_t parse_positive(const std::string& key, const std::string& value) {
  const auto parsed = std::stoll(value);
  if (parsed < 1 || parsed > 1'000'000) {
    throw std::runtime_error(key + " must be in range 1..1000000");
  }
  return static_cast<std::uint32_t>(parsed);
}

std::vector<std::string> split_list(const std::string& value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

model::source_id require_source(const std::string& key, const std::string& name) {
  const auto id = model::parse_source_id(name);
  if (!id.has_value()) {
    throw std::runtime_error(key + ": unknown source '" + name + "'");
  }
  return *id;
}

void apply_source_key(AgentConfig& config, const std::string& full_key, const std::string& name,
                      const std::string& field, const std::string& value) {
  SourceConfig& source = config.sources[require_source(full_key, name)];
  source.declared = true;

  if (field == "enabled") {
    source.enabled = parse_bool(value);
  } else if (field == "show_after") {
    source.options.debounce.required_to_activate = parse_positive(full_key, value);
  } else if (field == "hide_after") {
    source.options.debounce.required_to_deactivate = parse_positive(full_key, value);
  } else if (field == "every_ticks") {
    source.options.every_ticks = parse_positive(full_key, value);
  } else if (field == "idle_every_ticks") {
    source.options.idle_every_ticks = parse_positive(full_key, value);
  } else if (field == "timeout_ms") {
    const auto parsed = std::stoll(value);
    if (parsed < 0 || parsed > 600'000) {
      throw std::runtime_error(full_key + " must be in range 0..600000");
    }
    source.options.timeout = std::chrono::milliseconds(parsed);
    source.timeout_configured = true;
  } else if (field == "probe") {
    if (!probes::parse_probe_kind(value, source.probe.kind)) {
      throw std::runtime_error(full_key + ": unknown probe '" + value + "'");
    }
    source.probe_configured = true;
  } else if (field == "command") {
    source.probe.command = value;
  } else if (field == "process") {
    source.probe.process = value;
  } else if (field == "pattern") {
    source.probe.pattern = value;
  } else if (field == "line_count") {
    source.probe.line_count = parse_positive(full_key, value);
  } else if (field == "cpu_low") {
    source.probe.cpu_low_pct = std::stof(value);
  } else if (field == "cpu_high") {
    source.probe.cpu_high_pct = std::stof(value);
  } else if (field == "directory") {
    source.probe.directory = value;
  } else if (field == "extensions") {
    source.probe.extensions = split_list(value);
  } else if (field == "proc_root") {
    source.probe.proc_root = value;
  } else {
    throw std::runtime_error(full_key + ": unknown source setting '" + field + "'");
  }
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "tick_rate_hz") {
    const auto hz = std::stoi(value);
    if (hz <= 0) {
      throw std::runtime_error("tick_rate_hz must be greater than 0");
    }

    if (hz > 1000) {
      throw std::runtime_error("tick_rate_hz must be less than or equal to 1000");
    }

    config.tick_interval = std::chrono::milliseconds(1000 / hz);
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "diagnostics.path") {
    config.diagnostics_path = value;
    return;
  }

  if (key == "redis.key_prefix") {
    if (value.empty()) {
      throw std::runtime_error("redis.key_prefix must not be empty");
    }
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto parsed = std::stoi(value);
    if (parsed < 0) {
      throw std::runtime_error("redis.db must be 0 or greater");
    }
    config.redis.db = parsed;
    return;
  }

  if (key == "redis.address") {
    config.redis.enabled = !value.empty();
    if (value.rfind("unix://", 0) == 0) {
      config.redis.unix_socket = value.substr(std::string("unix://").size());
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    if (!value.empty() && value.front() == '/') {
      config.redis.unix_socket = value;
      config.redis.host.clear();
      config.redis.port = 0;
      return;
    }

    config.redis.unix_socket.clear();
    const auto split = value.find(':');
    if (split == std::string::npos) {
      config.redis.host = value;
      return;
    }

    config.redis.host = value.substr(0, split);
    const auto parsed_port = std::stoi(value.substr(split + 1));
    if (parsed_port <= 0 || parsed_port > 65535) {
      throw std::runtime_error("redis.address port must be in range 1..65535");
    }

    config.redis.port = static_cast<std::uint16_t>(parsed_port);
    return;
  }

  if (key.rfind("debug.", 0) == 0) {
    const std::string name = key.substr(std::string("debug.").size());
    config.sources[require_source(key, name)].options.debug = parse_bool(value);
    return;
  }

  if (key.rfind("sources.", 0) == 0) {
    const std::string rest = key.substr(std::string("sources.").size());
    const auto dot = rest.find('.');
    if (dot == std::string::npos) {
      throw std::runtime_error(key + ": expected sources.<name>.<setting>");
    }
    apply_source_key(config, key, rest.substr(0, dot), rest.substr(dot + 1), value);
  }
}

void finalize_sources(AgentConfig& config) {
  for (auto it = config.sources.begin(); it != config.sources.end();) {
    if (!it->second.declared) {
      it = config.sources.erase(it);
    } else {
      ++it;
    }
  }

  for (auto& [id, source] : config.sources) {
    const std::string prefix = std::string("sources.") + model::to_string(id);
    if (!source.enabled) {
      continue;
    }
    if (!source.probe_configured) {
      throw std::runtime_error(prefix + ".probe is required for an enabled source");
    }
    if (source.probe.cpu_high_pct < source.probe.cpu_low_pct) {
      throw std::runtime_error(prefix + ".cpu_high must be greater than or equal to cpu_low");
    }
    if (!source.timeout_configured) {
      const bool spawns = source.probe.kind == probes::probe_kind::COMMAND ||
                          source.probe.kind == probes::probe_kind::TERMINAL;
      source.options.timeout = spawns ? kDefaultProbeTimeout : std::chrono::milliseconds(0);
    }
  }
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find(" #");
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    } else if (!trim(line).empty() && trim(line).front() == '#') {
      continue;
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections.resize(depth);
        sections.push_back(key);
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    try {
      apply_key_value(config, full_key.str(), value);
    } catch (const std::invalid_argument&) {
      throw std::runtime_error(full_key.str() + ": invalid value '" + value + "'");
    } catch (const std::out_of_range&) {
      throw std::runtime_error(full_key.str() + ": value out of range '" + value + "'");
    }
  }

  finalize_sources(config);
  return config;
}

}  // namespace activity_agent::core
