#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "model/reading.hpp"

namespace activity_agent::probes {

class CancelToken {
 public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

struct SampleContext {
  // Unset for probes that only read cheap in-process state.
  std::optional<std::chrono::steady_clock::time_point> deadline{};
  std::shared_ptr<const CancelToken> cancel{};
  bool debug{false};

  [[nodiscard]] bool should_stop(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const noexcept {
    if (cancel != nullptr && cancel->cancelled()) {
      return true;
    }
    return deadline.has_value() && now >= *deadline;
  }
};

// Samples one source's raw state. A runner never calls sample() concurrently
// for the same probe. A missing process, window or permission is an inactive
// reading, not an error.
class Probe {
 public:
  virtual ~Probe() = default;

  // Cheap precondition; false short-circuits to an inactive reading.
  virtual bool available() noexcept { return true; }

  virtual model::reading sample(const SampleContext& context) = 0;

  // Drops history kept between samples. Runs on the probe's lane.
  virtual void reset() noexcept {}
};

}  // namespace activity_agent::probes
