#include "probes/factory.hpp"

#include <cstdlib>
#include <stdexcept>

#include "probes/command_probe.hpp"
#include "probes/cpu_probe.hpp"
#include "probes/download_probe.hpp"
#include "probes/process_probe.hpp"
#include "probes/terminal_probe.hpp"

namespace activity_agent::probes {
namespace {

std::string expand_home(const std::string& path) {
  if (path.empty() || path.front() != '~') {
    return path;
  }
  const char* home = std::getenv("HOME");
  if (home == nullptr) {
    return path;
  }
  return std::string(home) + path.substr(1);
}

}  // namespace

bool parse_probe_kind(const std::string& name, probe_kind& kind) noexcept {
  if (name == "command") {
    kind = probe_kind::COMMAND;
  } else if (name == "process") {
    kind = probe_kind::PROCESS;
  } else if (name == "terminal") {
    kind = probe_kind::TERMINAL;
  } else if (name == "cpu") {
    kind = probe_kind::CPU;
  } else if (name == "downloads") {
    kind = probe_kind::DOWNLOADS;
  } else {
    return false;
  }
  return true;
}

const char* to_string(const probe_kind kind) noexcept {
  switch (kind) {
    case probe_kind::COMMAND:
      return "command";
    case probe_kind::PROCESS:
      return "process";
    case probe_kind::TERMINAL:
      return "terminal";
    case probe_kind::CPU:
      return "cpu";
    case probe_kind::DOWNLOADS:
      return "downloads";
  }
  return "unknown";
}

std::shared_ptr<Probe> make_probe(const ProbeSpec& spec) {
  switch (spec.kind) {
    case probe_kind::COMMAND:
      if (spec.command.empty()) {
        throw std::invalid_argument("command probe requires 'command'");
      }
      return std::make_shared<CommandProbe>(spec.command, spec.pattern, spec.process, spec.proc_root);

    case probe_kind::PROCESS:
      if (spec.process.empty()) {
        throw std::invalid_argument("process probe requires 'process'");
      }
      return std::make_shared<ProcessProbe>(spec.process, spec.proc_root);

    case probe_kind::TERMINAL:
      if (spec.command.empty() || spec.pattern.empty()) {
        throw std::invalid_argument("terminal probe requires 'command' and 'pattern'");
      }
      return std::make_shared<TerminalProbe>(spec.command, spec.pattern, spec.line_count, spec.process,
                                             spec.proc_root);

    case probe_kind::CPU:
      if (spec.process.empty()) {
        throw std::invalid_argument("cpu probe requires 'process'");
      }
      return std::make_shared<CpuProbe>(spec.process, spec.cpu_low_pct, spec.cpu_high_pct, spec.proc_root);

    case probe_kind::DOWNLOADS: {
      const std::string directory = expand_home(spec.directory.empty() ? "~/Downloads" : spec.directory);
      if (spec.extensions.empty()) {
        return std::make_shared<DownloadProbe>(directory);
      }
      return std::make_shared<DownloadProbe>(directory, spec.extensions);
    }
  }
  throw std::invalid_argument("unknown probe kind");
}

}  // namespace activity_agent::probes
