#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "probes/probe.hpp"

namespace activity_agent::probes {

// Active while a partial download file in `directory` is new or growing.
// Stalled or orphaned partial files do not count.
class DownloadProbe final : public Probe {
 public:
  explicit DownloadProbe(std::string directory,
                         std::vector<std::string> extensions = {"crdownload", "download", "part"});

  model::reading sample(const SampleContext& context) override;
  void reset() noexcept override;

 private:
  [[nodiscard]] bool is_partial(const std::string& extension) const;

  std::string directory_;
  std::vector<std::string> extensions_;
  std::unordered_map<std::string, std::uintmax_t> previous_sizes_{};
};

}  // namespace activity_agent::probes
