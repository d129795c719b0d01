#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "probes/probe.hpp"

namespace activity_agent::probes {

enum class command_status : std::uint8_t {
  EXITED = 0,
  LAUNCH_FAILED = 1,
  TIMED_OUT = 2,
  CANCELLED = 3,
};

struct CommandResult {
  command_status status{command_status::LAUNCH_FAILED};
  int exit_code{-1};
  std::string output{};

  [[nodiscard]] bool succeeded() const noexcept { return status == command_status::EXITED && exit_code == 0; }
};

// Runs argv[0] with stdout captured. The child gets its own process group and
// the whole group is killed when the context deadline passes or it is cancelled.
CommandResult run_command(const std::vector<std::string>& argv, const SampleContext& context,
                          std::size_t max_output_bytes = 256U * 1024U);

CommandResult run_shell(const std::string& command, const SampleContext& context,
                        std::size_t max_output_bytes = 256U * 1024U);

const char* to_string(command_status status) noexcept;

}  // namespace activity_agent::probes
