#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "core/debounce.hpp"
#include "core/publish_queue.hpp"
#include "core/worker_lane.hpp"
#include "model/reading.hpp"
#include "model/source.hpp"
#include "probes/probe.hpp"

namespace activity_agent::core {

struct SourceOptions {
  model::debounce_config debounce{};
  // Zero disables the watchdog for probes that only read in-process state.
  std::chrono::milliseconds timeout{0};
  std::uint64_t every_ticks{1};
  // Cadence while the source is committed inactive.
  std::uint64_t idle_every_ticks{1};
  bool debug{false};
};

enum class poll_result : std::uint8_t {
  DISPATCHED = 0,
  DROPPED_IN_FLIGHT = 1,
};

struct apply_result {
  bool accepted{false};
  model::transition change{model::transition::NONE};
};

// Wraps one probe with its own worker lane, whose single slot is the in-flight
// guard, and a deadline watchdog. poll(), check_deadline(), apply() and reset() run on the publishing
// thread; only the probe call runs on the lane.
class SourceRunner {
 public:
  using ResultHandler = std::function<void(model::source_id, std::uint64_t generation, const model::reading&)>;

  SourceRunner(model::source_id id, SourceOptions options, std::shared_ptr<probes::Probe> probe, PublishQueue& queue,
               ResultHandler on_result);
  ~SourceRunner();

  SourceRunner(const SourceRunner&) = delete;
  SourceRunner& operator=(const SourceRunner&) = delete;

  // Never blocks. Throws std::logic_error on a disabled runner.
  poll_result poll();

  // Cancels an expired dispatch and posts a synthetic inactive reading.
  bool check_deadline(std::chrono::steady_clock::time_point now);
  [[nodiscard]] std::optional<std::chrono::steady_clock::time_point> pending_deadline();

  apply_result apply(std::uint64_t generation, const model::reading& reading);

  // Returns true when the source was committed active before the reset.
  bool reset();

  void enable(SourceOptions options, std::shared_ptr<probes::Probe> probe);
  void disable() noexcept;

  bool wait_idle(std::chrono::milliseconds timeout) const;

  [[nodiscard]] model::source_id id() const noexcept { return id_; }
  [[nodiscard]] const char* name() const noexcept { return model::to_string(id_); }
  [[nodiscard]] const SourceOptions& options() const noexcept { return options_; }
  [[nodiscard]] bool enabled() const noexcept { return enabled_; }
  [[nodiscard]] bool in_flight() const { return lane_->busy(); }
  [[nodiscard]] bool active() const noexcept { return debounce_.active(); }
  [[nodiscard]] const model::debounce_state& state() const noexcept { return debounce_.state(); }
  [[nodiscard]] const std::optional<model::reading>& last_reading() const noexcept { return last_reading_; }
  [[nodiscard]] std::uint64_t generation() const noexcept { return generation_; }
  [[nodiscard]] std::uint64_t dropped_polls() const noexcept { return dropped_polls_; }
  [[nodiscard]] std::uint64_t timeouts() const noexcept { return timeouts_; }

 private:
  struct Dispatch {
    std::uint64_t generation{0};
    std::optional<std::chrono::steady_clock::time_point> deadline{};
    std::shared_ptr<probes::CancelToken> cancel{std::make_shared<probes::CancelToken>()};
    // First of {probe return, watchdog} to flip this publishes the reading.
    std::atomic<bool> resolved{false};
  };

  void run_sample(const std::shared_ptr<Dispatch>& dispatch, const std::shared_ptr<probes::Probe>& probe, bool debug);
  model::reading sample_probe(probes::Probe& probe, const Dispatch& dispatch, bool debug);
  void publish(std::uint64_t generation, model::reading reading);

  model::source_id id_;
  SourceOptions options_;
  std::shared_ptr<probes::Probe> probe_;
  PublishQueue& queue_;
  ResultHandler on_result_;

  DebounceStateMachine debounce_;
  std::optional<model::reading> last_reading_{};
  bool enabled_{true};
  std::uint64_t generation_{1};
  std::uint64_t dropped_polls_{0};
  std::uint64_t timeouts_{0};
  std::shared_ptr<Dispatch> current_{};

  std::atomic<bool> probe_reset_pending_{false};

  // Declared last: joined before the state the lane task touches goes away.
  std::unique_ptr<WorkerLane> lane_;
};

}  // namespace activity_agent::core
