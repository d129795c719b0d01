#include "probes/terminal_probe.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "probes/process_probe.hpp"
#include "probes/process_runner.hpp"

namespace activity_agent::probes {
namespace {

constexpr const char* kSessionMarker = "---SESSION---";
constexpr const char* kTabMarker = "---TAB---";

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::vector<std::string> split_on(const std::string& text, const std::string& marker) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(marker, start);
    if (pos == std::string::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + marker.size();
  }
}

}  // namespace

std::vector<TerminalSession> parse_sessions(const std::string& output, const std::size_t line_count) {
  std::vector<std::string> parts;
  if (output.find(kSessionMarker) != std::string::npos) {
    parts = split_on(output, kSessionMarker);
  } else if (output.find(kTabMarker) != std::string::npos) {
    parts = split_on(output, kTabMarker);
  } else {
    parts.push_back(output);
  }

  std::vector<TerminalSession> sessions;
  for (const auto& part : parts) {
    const std::string trimmed = trim(part);
    if (trimmed.empty()) {
      continue;
    }

    std::vector<std::string> lines;
    std::istringstream stream(trimmed);
    std::string line;
    while (std::getline(stream, line)) {
      line = trim(line);
      if (!line.empty()) {
        lines.push_back(std::move(line));
      }
    }

    TerminalSession session{};
    session.content = trimmed;
    const std::size_t keep = std::min(line_count, lines.size());
    session.last_lines.assign(lines.end() - static_cast<std::ptrdiff_t>(keep), lines.end());
    sessions.push_back(std::move(session));
  }
  return sessions;
}

TerminalProbe::TerminalProbe(std::string capture_command, const std::string& pattern, const std::size_t line_count,
                             std::string required_process, std::string proc_root)
    : capture_command_(std::move(capture_command)),
      pattern_(pattern),
      line_count_(line_count),
      required_process_(std::move(required_process)),
      proc_root_(std::move(proc_root)) {
  if (capture_command_.empty()) {
    throw std::invalid_argument("terminal probe requires a capture command");
  }
  if (line_count_ == 0) {
    throw std::invalid_argument("terminal probe line_count must be at least 1");
  }
}

bool TerminalProbe::available() noexcept {
  if (required_process_.empty()) {
    return true;
  }
  return !find_processes(proc_root_, required_process_).empty();
}

bool TerminalProbe::matches(const std::string& captured, std::string* matched_line) const {
  for (const auto& session : parse_sessions(captured, line_count_)) {
    for (const auto& line : session.last_lines) {
      if (std::regex_search(line, pattern_)) {
        if (matched_line != nullptr) {
          *matched_line = line.substr(0, 100);
        }
        return true;
      }
    }
  }
  return false;
}

model::reading TerminalProbe::sample(const SampleContext& context) {
  const CommandResult result = run_shell(capture_command_, context);
  if (result.status == command_status::TIMED_OUT || result.status == command_status::CANCELLED) {
    return model::inactive_reading(model::reading_origin::TIMEOUT, "capture " + std::string(to_string(result.status)));
  }
  if (!result.succeeded()) {
    return model::inactive_reading(model::reading_origin::FAILURE, "capture unavailable");
  }

  std::string line;
  if (matches(result.output, &line)) {
    if (context.debug) {
      std::cerr << "[probe] terminal match: " << line << '\n';
    }
    return model::active_reading(line);
  }
  return model::inactive_reading();
}

}  // namespace activity_agent::probes
