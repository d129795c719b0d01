#pragma once

#include <chrono>

#include "model/reading.hpp"
#include "model/source.hpp"

namespace activity_agent::sinks {

// Diagnostic channel. Called on the publishing thread; implementations must not
// throw and must not block on the network.
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void on_reading(model::source_id id, const model::reading& reading, const model::debounce_state& state) = 0;
  virtual void on_transition(model::source_id id, model::transition change, const model::reading* cause) = 0;
  virtual void on_timeout(model::source_id id, std::chrono::milliseconds deadline) = 0;
  virtual void on_dropped_tick(model::source_id id) = 0;
  virtual void on_stale_sample(model::source_id id, const model::reading& reading) = 0;
};

}  // namespace activity_agent::sinks
