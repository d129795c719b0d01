#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

#include "probes/probe.hpp"

namespace activity_agent::probes {

// CPU usage of every process named `process_name`, summed. Above `high_pct` is
// active, below `low_pct` inactive, and the band in between is neutral.
class CpuProbe final : public Probe {
 public:
  CpuProbe(std::string process_name, float low_pct, float high_pct, std::string proc_root = "/proc",
           long clock_ticks_per_second = 0);

  bool available() noexcept override;
  model::reading sample(const SampleContext& context) override;
  void reset() noexcept override;

  [[nodiscard]] std::optional<float> last_cpu_pct() const noexcept { return last_cpu_pct_; }

 private:
  bool read_uptime(double& seconds) const;
  bool read_process_ticks(int pid, std::uint64_t& ticks) const;

  std::string process_name_;
  float low_pct_;
  float high_pct_;
  std::string proc_root_;
  long clock_ticks_per_second_;

  std::unordered_map<int, std::uint64_t> prev_ticks_{};
  std::optional<double> prev_uptime_{};
  std::optional<float> last_cpu_pct_{};
};

}  // namespace activity_agent::probes
