#include "probes/command_probe.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/math.hpp"
#include "probes/process_probe.hpp"
#include "probes/process_runner.hpp"

namespace activity_agent::probes {

CommandProbe::CommandProbe(std::string command, std::optional<std::string> pattern, std::string required_process,
                           std::string proc_root)
    : command_(std::move(command)), required_process_(std::move(required_process)), proc_root_(std::move(proc_root)) {
  if (command_.empty()) {
    throw std::invalid_argument("command probe requires a command");
  }
  if (pattern.has_value() && !pattern->empty()) {
    pattern_ = std::regex(*pattern);
  }
}

bool CommandProbe::available() noexcept {
  if (required_process_.empty()) {
    return true;
  }
  return !find_processes(proc_root_, required_process_).empty();
}

model::reading CommandProbe::sample(const SampleContext& context) {
  const CommandResult result = run_shell(command_, context);
  if (context.debug) {
    std::cerr << "[probe] command status=" << to_string(result.status) << " exit=" << result.exit_code
              << " bytes=" << result.output.size() << '\n';
  }

  switch (result.status) {
    case command_status::TIMED_OUT:
    case command_status::CANCELLED:
      return model::inactive_reading(model::reading_origin::TIMEOUT, "command " + std::string(to_string(result.status)));
    case command_status::LAUNCH_FAILED:
      return model::inactive_reading(model::reading_origin::FAILURE, "command failed to launch");
    case command_status::EXITED:
      break;
  }

  if (!result.succeeded()) {
    return model::inactive_reading(model::reading_origin::SAMPLE, "exit " + std::to_string(result.exit_code));
  }
  if (!pattern_.has_value()) {
    return model::active_reading("exit 0");
  }

  std::smatch match;
  if (std::regex_search(result.output, match, *pattern_)) {
    model::reading reading = model::active_reading(match.str(0));
    // A first capture group, when present, is read as a completion percentage.
    if (match.size() > 1 && match[1].matched) {
      reading.progress = core::parse_percent_fraction(match[1].str());
    }
    return reading;
  }
  return model::inactive_reading();
}

}  // namespace activity_agent::probes
