#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "core/scheduler.hpp"
#include "model/source.hpp"

namespace activity_agent::core {

// Fans in every runner's transitions and republishes the set of active sources.
// Observers run synchronously on the publishing thread and only when the set
// actually changed.
class Aggregator {
 public:
  using Observer = std::function<void(const model::active_set&)>;

  explicit Aggregator(Scheduler& scheduler);

  Aggregator(const Aggregator&) = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  void subscribe(Observer observer);

  // Returns true when the recomputed set differs from the published one.
  bool recompute();

  [[nodiscard]] const model::active_set& active() const noexcept { return active_; }
  [[nodiscard]] std::size_t recompute_count() const noexcept { return recompute_count_; }
  [[nodiscard]] std::size_t publish_count() const noexcept { return publish_count_; }

 private:
  Scheduler& scheduler_;
  std::vector<Observer> observers_{};
  model::active_set active_{};
  std::size_t recompute_count_{0};
  std::size_t publish_count_{0};
};

}  // namespace activity_agent::core
