#include "core/debounce.hpp"

#include <limits>
#include <stdexcept>
#include <string>

namespace activity_agent::core {
namespace {

void saturating_increment(std::uint32_t& counter) noexcept {
  if (counter < std::numeric_limits<std::uint32_t>::max()) {
    ++counter;
  }
}

}  // namespace

model::debounce_config make_debounce_config(const std::uint32_t required_to_activate,
                                            const std::uint32_t required_to_deactivate) {
  if (required_to_activate == 0) {
    throw std::invalid_argument("required_to_activate must be at least 1");
  }
  if (required_to_deactivate == 0) {
    throw std::invalid_argument("required_to_deactivate must be at least 1");
  }
  return model::debounce_config{required_to_activate, required_to_deactivate};
}

DebounceStateMachine::DebounceStateMachine(model::debounce_config config)
    : config_(make_debounce_config(config.required_to_activate, config.required_to_deactivate)) {}

model::transition DebounceStateMachine::update(const model::reading_state reading) noexcept {
  switch (reading) {
    case model::reading_state::ACTIVE:
      saturating_increment(state_.consecutive_active);
      state_.consecutive_inactive = 0;
      if (state_.consecutive_active >= config_.required_to_activate && !state_.is_active) {
        state_.is_active = true;
        return model::transition::ACTIVATED;
      }
      break;

    case model::reading_state::INACTIVE:
      saturating_increment(state_.consecutive_inactive);
      state_.consecutive_active = 0;
      if (state_.consecutive_inactive >= config_.required_to_deactivate && state_.is_active) {
        state_.is_active = false;
        return model::transition::DEACTIVATED;
      }
      break;

    case model::reading_state::NEUTRAL:
      break;
  }

  return model::transition::NONE;
}

void DebounceStateMachine::reset() noexcept { state_ = model::debounce_state{}; }

}  // namespace activity_agent::core
