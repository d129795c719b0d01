#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "core/publish_queue.hpp"
#include "core/source_runner.hpp"
#include "model/reading.hpp"
#include "model/source.hpp"
#include "probes/probe.hpp"
#include "sinks/event_sink.hpp"

namespace activity_agent::core {

struct SchedulerOptions {
  std::chrono::milliseconds tick_interval{1000};
};

struct SchedulerStats {
  std::size_t ticks_executed{0};
  std::size_t polls_dispatched{0};
  std::size_t polls_dropped{0};
  std::size_t timeouts{0};
  std::size_t readings_applied{0};
  std::size_t stale_samples{0};
  std::size_t transitions{0};
};

// Fixed-interval tick driver. The thread that calls run_for_ticks() (or
// tick()/run_pending() directly) is the publishing thread: debounce state and
// transition listeners only ever run there.
class Scheduler {
 public:
  using TransitionListener = std::function<void(model::source_id, model::transition)>;

  explicit Scheduler(SchedulerOptions options = {});
  ~Scheduler();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Throws std::logic_error when the identity is already registered and enabled.
  void add_source(model::source_id id, SourceOptions options, std::shared_ptr<probes::Probe> probe);
  // Throws std::logic_error when the identity is not registered.
  void remove_source(model::source_id id);
  [[nodiscard]] bool has_source(model::source_id id) const;

  void add_event_sink(sinks::EventSink* sink);
  void add_transition_listener(TransitionListener listener);

  void tick();
  std::size_t run_pending();
  SchedulerStats run_for_ticks(std::size_t total_ticks);

  // Thread-safe.
  void post(std::function<void()> task);
  void stop();

  [[nodiscard]] model::active_set active_sources() const;
  [[nodiscard]] std::vector<model::source_id> registered_sources() const;
  [[nodiscard]] std::optional<model::reading> last_reading(model::source_id id) const;
  [[nodiscard]] std::optional<model::debounce_state> state(model::source_id id) const;
  [[nodiscard]] bool in_flight(model::source_id id) const;
  bool wait_idle(model::source_id id, std::chrono::milliseconds timeout) const;

  [[nodiscard]] const SchedulerStats& stats() const noexcept { return stats_; }
  [[nodiscard]] std::chrono::milliseconds tick_interval() const noexcept { return tick_interval_; }

 private:
  void handle_result(model::source_id id, std::uint64_t generation, const model::reading& reading);
  void notify_transition(model::source_id id, model::transition change, const model::reading* cause);
  void service_until(std::chrono::steady_clock::time_point until);
  void check_deadlines(std::chrono::steady_clock::time_point now);
  [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> earliest_deadline();
  [[nodiscard]] bool cadence_allows(const SourceRunner& runner) const noexcept;
  [[nodiscard]] const SourceRunner* find_enabled(model::source_id id) const;

  std::chrono::milliseconds tick_interval_;
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  std::uint64_t tick_count_{0};
  std::atomic<bool> stop_requested_{false};
  SchedulerStats stats_{};

  std::vector<sinks::EventSink*> event_sinks_{};
  std::vector<TransitionListener> transition_listeners_{};

  // Runners post into the queue from their lanes, so it must outlive them.
  PublishQueue queue_{};
  std::map<model::source_id, std::unique_ptr<SourceRunner>> runners_{};
};

}  // namespace activity_agent::core
