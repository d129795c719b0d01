#include "core/aggregator.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace activity_agent::core {

Aggregator::Aggregator(Scheduler& scheduler) : scheduler_(scheduler) {
  scheduler_.add_transition_listener([this](model::source_id, model::transition) { recompute(); });
}

void Aggregator::subscribe(Observer observer) { observers_.push_back(std::move(observer)); }

bool Aggregator::recompute() {
  ++recompute_count_;

  model::active_set next = scheduler_.active_sources();
  if (next == active_) {
    return false;
  }

  active_ = std::move(next);
  ++publish_count_;

  for (const auto& observer : observers_) {
    try {
      observer(active_);
    } catch (const std::exception& ex) {
      std::cerr << "[aggregator] observer failed: " << ex.what() << '\n';
    }
  }
  return true;
}

}  // namespace activity_agent::core
