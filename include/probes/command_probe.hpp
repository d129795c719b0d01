#pragma once

#include <optional>
#include <regex>
#include <string>

#include "probes/probe.hpp"

namespace activity_agent::probes {

// Runs a shell command each sample. Without a pattern the exit status decides
// (0 = active); with a pattern the command must succeed and its output match.
class CommandProbe final : public Probe {
 public:
  explicit CommandProbe(std::string command, std::optional<std::string> pattern = std::nullopt,
                        std::string required_process = {}, std::string proc_root = "/proc");

  bool available() noexcept override;
  model::reading sample(const SampleContext& context) override;

 private:
  std::string command_;
  std::optional<std::regex> pattern_{};
  std::string required_process_;
  std::string proc_root_;
};

}  // namespace activity_agent::probes
