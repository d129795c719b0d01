#include "core/source_runner.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "core/timestamp.hpp"

namespace activity_agent::core {

SourceRunner::SourceRunner(const model::source_id id, SourceOptions options, std::shared_ptr<probes::Probe> probe,
                           PublishQueue& queue, ResultHandler on_result)
    : id_(id),
      options_(options),
      probe_(std::move(probe)),
      queue_(queue),
      on_result_(std::move(on_result)),
      debounce_(options.debounce),
      lane_(std::make_unique<WorkerLane>(model::to_string(id))) {
  if (probe_ == nullptr) {
    throw std::invalid_argument(std::string("source ") + name() + " registered without a probe");
  }
  if (options_.every_ticks == 0 || options_.idle_every_ticks == 0) {
    throw std::invalid_argument(std::string("source ") + name() + " cadence must be at least 1 tick");
  }
}

SourceRunner::~SourceRunner() {
  if (current_ != nullptr) {
    current_->cancel->cancel();
  }
  lane_->stop();
}

poll_result SourceRunner::poll() {
  if (!enabled_) {
    throw std::logic_error(std::string("poll on removed source ") + name());
  }

  auto dispatch = std::make_shared<Dispatch>();
  dispatch->generation = generation_;
  if (options_.timeout.count() > 0) {
    dispatch->deadline = std::chrono::steady_clock::now() + options_.timeout;
  }

  // The lane's single task slot is the in-flight guard.
  const bool submitted = lane_->try_submit(
      [this, dispatch, probe = probe_, debug = options_.debug]() { run_sample(dispatch, probe, debug); });
  if (!submitted) {
    ++dropped_polls_;
    return poll_result::DROPPED_IN_FLIGHT;
  }

  current_ = std::move(dispatch);
  return poll_result::DISPATCHED;
}

void SourceRunner::run_sample(const std::shared_ptr<Dispatch>& dispatch, const std::shared_ptr<probes::Probe>& probe,
                              const bool debug) {
  if (probe_reset_pending_.exchange(false)) {
    probe->reset();
  }

  model::reading reading = sample_probe(*probe, *dispatch, debug);
  if (dispatch->resolved.exchange(true)) {
    if (debug) {
      std::cerr << "[runner] " << name() << " late result after deadline discarded\n";
    }
    return;
  }
  publish(dispatch->generation, std::move(reading));
}

model::reading SourceRunner::sample_probe(probes::Probe& probe, const Dispatch& dispatch, const bool debug) {
  try {
    if (!probe.available()) {
      return model::inactive_reading(model::reading_origin::PRECHECK, "precondition not met");
    }

    probes::SampleContext context{};
    context.deadline = dispatch.deadline;
    context.cancel = dispatch.cancel;
    context.debug = debug;
    return probe.sample(context);
  } catch (const std::exception& ex) {
    std::cerr << "[runner] " << name() << " probe failed: " << ex.what() << '\n';
    return model::inactive_reading(model::reading_origin::FAILURE, ex.what());
  }
}

void SourceRunner::publish(const std::uint64_t generation, model::reading reading) {
  reading.monotonic_ns = monotonic_timestamp_now_ns();
  queue_.post([this, generation, reading = std::move(reading)]() { on_result_(id_, generation, reading); });
}

std::optional<std::chrono::steady_clock::time_point> SourceRunner::pending_deadline() {
  if (current_ == nullptr) {
    return std::nullopt;
  }
  if (current_->resolved.load()) {
    current_.reset();
    return std::nullopt;
  }
  return current_->deadline;
}

bool SourceRunner::check_deadline(const std::chrono::steady_clock::time_point now) {
  const auto deadline = pending_deadline();
  if (!deadline.has_value() || now < *deadline) {
    return false;
  }

  const auto dispatch = std::move(current_);
  current_.reset();
  if (dispatch->resolved.exchange(true)) {
    return false;
  }

  dispatch->cancel->cancel();
  ++timeouts_;
  publish(dispatch->generation, model::inactive_reading(model::reading_origin::TIMEOUT, "deadline exceeded"));
  return true;
}

apply_result SourceRunner::apply(const std::uint64_t generation, const model::reading& reading) {
  apply_result result{};
  if (!enabled_ || generation != generation_) {
    return result;
  }

  result.accepted = true;
  last_reading_ = reading;
  result.change = debounce_.update(reading);

  if (options_.debug) {
    const auto& state = debounce_.state();
    std::cerr << "[runner] " << name() << " reading=" << model::to_string(reading.state)
              << " origin=" << model::to_string(reading.origin) << " active_streak=" << state.consecutive_active << '/'
              << debounce_.config().required_to_activate << " inactive_streak=" << state.consecutive_inactive << '/'
              << debounce_.config().required_to_deactivate << '\n';
  }
  return result;
}

bool SourceRunner::reset() {
  const bool was_active = debounce_.active();
  ++generation_;
  debounce_.reset();
  last_reading_.reset();
  // current_ survives so the watchdog still cancels an in-flight sample at its
  // deadline; its result carries the old generation and is discarded.
  probe_reset_pending_.store(true);
  return was_active;
}

void SourceRunner::enable(SourceOptions options, std::shared_ptr<probes::Probe> probe) {
  if (probe == nullptr) {
    throw std::invalid_argument(std::string("source ") + name() + " registered without a probe");
  }
  if (options.every_ticks == 0 || options.idle_every_ticks == 0) {
    throw std::invalid_argument(std::string("source ") + name() + " cadence must be at least 1 tick");
  }
  debounce_ = DebounceStateMachine(options.debounce);
  options_ = options;
  probe_ = std::move(probe);
  reset();
  enabled_ = true;
}

void SourceRunner::disable() noexcept { enabled_ = false; }

bool SourceRunner::wait_idle(const std::chrono::milliseconds timeout) const { return lane_->wait_idle(timeout); }

}  // namespace activity_agent::core
