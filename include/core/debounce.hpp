#pragma once

#include "model/reading.hpp"

namespace activity_agent::core {

// Converts raw readings into committed active/inactive transitions using
// asymmetric consecutive-reading thresholds. Not thread-safe: owned and
// mutated by the publishing thread only.
class DebounceStateMachine {
 public:
  explicit DebounceStateMachine(model::debounce_config config = {});

  model::transition update(model::reading_state reading) noexcept;
  model::transition update(const model::reading& reading) noexcept { return update(reading.state); }

  void reset() noexcept;

  [[nodiscard]] bool active() const noexcept { return state_.is_active; }
  [[nodiscard]] const model::debounce_state& state() const noexcept { return state_; }
  [[nodiscard]] const model::debounce_config& config() const noexcept { return config_; }

 private:
  model::debounce_config config_;
  model::debounce_state state_{};
};

// Throws std::invalid_argument when a threshold is zero.
model::debounce_config make_debounce_config(std::uint32_t required_to_activate, std::uint32_t required_to_deactivate);

}  // namespace activity_agent::core
