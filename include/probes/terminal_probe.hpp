#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <vector>

#include "probes/probe.hpp"

namespace activity_agent::probes {

struct TerminalSession {
  std::string content;
  std::vector<std::string> last_lines;
};

// Splits captured terminal text on "---SESSION---"/"---TAB---" markers and
// keeps the last `line_count` non-empty trimmed lines of each part.
std::vector<TerminalSession> parse_sessions(const std::string& output, std::size_t line_count);

// Captures terminal text with a command (e.g. `tmux capture-pane -p`) and
// reports active when the pattern appears in the tail of any session.
class TerminalProbe final : public Probe {
 public:
  TerminalProbe(std::string capture_command, const std::string& pattern, std::size_t line_count = 10,
                std::string required_process = {}, std::string proc_root = "/proc");

  bool available() noexcept override;
  model::reading sample(const SampleContext& context) override;

  [[nodiscard]] bool matches(const std::string& captured, std::string* matched_line = nullptr) const;

 private:
  std::string capture_command_;
  std::regex pattern_;
  std::size_t line_count_;
  std::string required_process_;
  std::string proc_root_;
};

}  // namespace activity_agent::probes
