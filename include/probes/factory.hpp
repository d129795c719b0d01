#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "probes/probe.hpp"

namespace activity_agent::probes {

enum class probe_kind : std::uint8_t {
  COMMAND = 0,
  PROCESS = 1,
  TERMINAL = 2,
  CPU = 3,
  DOWNLOADS = 4,
};

struct ProbeSpec {
  probe_kind kind{probe_kind::PROCESS};
  std::string command{};
  std::string process{};
  std::string pattern{};
  std::size_t line_count{10};
  float cpu_low_pct{10.0F};
  float cpu_high_pct{20.0F};
  std::string directory{};
  std::vector<std::string> extensions{};
  std::string proc_root{"/proc"};
};

bool parse_probe_kind(const std::string& name, probe_kind& kind) noexcept;
const char* to_string(probe_kind kind) noexcept;

// Throws std::invalid_argument when a ProbeSpec lacks what its kind needs.
std::shared_ptr<Probe> make_probe(const ProbeSpec& spec);

}  // namespace activity_agent::probes
