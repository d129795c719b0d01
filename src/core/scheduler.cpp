#include "core/scheduler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace activity_agent::core {

Scheduler::Scheduler(SchedulerOptions options) : tick_interval_(options.tick_interval) {
  if (tick_interval_.count() <= 0) {
    throw std::invalid_argument("tick_interval must be greater than 0");
  }
}

Scheduler::~Scheduler() { runners_.clear(); }

void Scheduler::add_source(const model::source_id id, SourceOptions options, std::shared_ptr<probes::Probe> probe) {
  const auto it = runners_.find(id);
  if (it != runners_.end()) {
    if (it->second->enabled()) {
      throw std::logic_error(std::string("duplicate source registration: ") + model::to_string(id));
    }
    it->second->enable(options, std::move(probe));
    std::cerr << "[scheduler] re-enabled source " << model::to_string(id) << '\n';
    return;
  }

  auto runner = std::make_unique<SourceRunner>(
      id, options, std::move(probe), queue_,
      [this](const model::source_id source, const std::uint64_t generation, const model::reading& reading) {
        handle_result(source, generation, reading);
      });
  runners_.emplace(id, std::move(runner));
  std::cerr << "[scheduler] registered source " << model::to_string(id) << " show_after="
            << options.debounce.required_to_activate << " hide_after=" << options.debounce.required_to_deactivate
            << " timeout_ms=" << options.timeout.count() << '\n';
}

void Scheduler::remove_source(const model::source_id id) {
  const auto it = runners_.find(id);
  if (it == runners_.end() || !it->second->enabled()) {
    throw std::logic_error(std::string("remove of unregistered source: ") + model::to_string(id));
  }

  SourceRunner& runner = *it->second;
  runner.disable();
  const bool was_active = runner.reset();
  std::cerr << "[scheduler] removed source " << model::to_string(id)
            << (runner.in_flight() ? " (in-flight sample will be discarded)" : "") << '\n';
  if (was_active) {
    notify_transition(id, model::transition::DEACTIVATED, nullptr);
  }
}

bool Scheduler::has_source(const model::source_id id) const { return find_enabled(id) != nullptr; }

void Scheduler::add_event_sink(sinks::EventSink* sink) {
  if (sink != nullptr) {
    event_sinks_.push_back(sink);
  }
}

void Scheduler::add_transition_listener(TransitionListener listener) {
  transition_listeners_.push_back(std::move(listener));
}

bool Scheduler::cadence_allows(const SourceRunner& runner) const noexcept {
  const auto& options = runner.options();
  const std::uint64_t every = runner.active() ? options.every_ticks : options.idle_every_ticks;
  if (every == 0) {
    return false;
  }
  return (tick_count_ % every) == 0;
}

void Scheduler::tick() {
  for (auto& [id, runner] : runners_) {
    if (!runner->enabled() || !cadence_allows(*runner)) {
      continue;
    }

    if (runner->poll() == poll_result::DISPATCHED) {
      ++stats_.polls_dispatched;
      continue;
    }

    ++stats_.polls_dropped;
    if (runner->options().debug) {
      std::cerr << "[scheduler] " << model::to_string(id) << " tick dropped; sample still in flight\n";
    }
    for (auto* sink : event_sinks_) {
      sink->on_dropped_tick(id);
    }
  }

  ++tick_count_;
  ++stats_.ticks_executed;
}

std::size_t Scheduler::run_pending() {
  check_deadlines(std::chrono::steady_clock::now());
  return queue_.run_pending();
}

SchedulerStats Scheduler::run_for_ticks(const std::size_t total_ticks) {
  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    if (stop_requested_.load()) {
      break;
    }

    tick();

    next_wakeup_ += tick_interval_;
    const auto now = std::chrono::steady_clock::now();
    if (next_wakeup_ < now) {
      next_wakeup_ = now;
    }
    service_until(next_wakeup_);
  }

  return stats_;
}

void Scheduler::service_until(const std::chrono::steady_clock::time_point until) {
  while (!stop_requested_.load()) {
    auto wake = until;
    const auto deadline = earliest_deadline();
    if (deadline.has_value() && *deadline < wake) {
      wake = *deadline;
    }

    queue_.run_until(wake);

    const auto now = std::chrono::steady_clock::now();
    check_deadlines(now);
    if (now >= until) {
      queue_.run_pending();
      return;
    }
  }
}

void Scheduler::post(std::function<void()> task) { queue_.post(std::move(task)); }

void Scheduler::stop() {
  stop_requested_.store(true);
  queue_.interrupt();
}

std::optional<std::chrono::steady_clock::time_point> Scheduler::earliest_deadline() {
  std::optional<std::chrono::steady_clock::time_point> earliest{};
  for (auto& [id, runner] : runners_) {
    (void)id;
    const auto deadline = runner->pending_deadline();
    if (deadline.has_value() && (!earliest.has_value() || *deadline < *earliest)) {
      earliest = deadline;
    }
  }
  return earliest;
}

void Scheduler::check_deadlines(const std::chrono::steady_clock::time_point now) {
  for (auto& [id, runner] : runners_) {
    if (!runner->check_deadline(now)) {
      continue;
    }

    ++stats_.timeouts;
    std::cerr << "[runner] " << model::to_string(id) << " probe exceeded " << runner->options().timeout.count()
              << "ms deadline; treating as inactive\n";
    for (auto* sink : event_sinks_) {
      sink->on_timeout(id, runner->options().timeout);
    }
  }
}

void Scheduler::handle_result(const model::source_id id, const std::uint64_t generation,
                              const model::reading& reading) {
  const auto it = runners_.find(id);
  const apply_result result = it != runners_.end() ? it->second->apply(generation, reading) : apply_result{};

  if (!result.accepted) {
    ++stats_.stale_samples;
    for (auto* sink : event_sinks_) {
      sink->on_stale_sample(id, reading);
    }
    return;
  }

  ++stats_.readings_applied;
  for (auto* sink : event_sinks_) {
    sink->on_reading(id, reading, it->second->state());
  }

  if (result.change != model::transition::NONE) {
    notify_transition(id, result.change, &reading);
  }
}

void Scheduler::notify_transition(const model::source_id id, const model::transition change,
                                  const model::reading* cause) {
  ++stats_.transitions;
  std::cerr << "[scheduler] " << model::to_string(id)
            << (change == model::transition::ACTIVATED ? " became active" : " became inactive");
  if (cause != nullptr && !cause->detail.empty()) {
    std::cerr << ": " << cause->detail;
  }
  std::cerr << '\n';

  for (auto* sink : event_sinks_) {
    sink->on_transition(id, change, cause);
  }
  for (const auto& listener : transition_listeners_) {
    listener(id, change);
  }
}

const SourceRunner* Scheduler::find_enabled(const model::source_id id) const {
  const auto it = runners_.find(id);
  if (it == runners_.end() || !it->second->enabled()) {
    return nullptr;
  }
  return it->second.get();
}

model::active_set Scheduler::active_sources() const {
  model::active_set active;
  for (const auto& [id, runner] : runners_) {
    if (runner->enabled() && runner->active()) {
      active.insert(id);
    }
  }
  return active;
}

std::vector<model::source_id> Scheduler::registered_sources() const {
  std::vector<model::source_id> ids;
  for (const auto& [id, runner] : runners_) {
    if (runner->enabled()) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::optional<model::reading> Scheduler::last_reading(const model::source_id id) const {
  const auto* runner = find_enabled(id);
  if (runner == nullptr) {
    return std::nullopt;
  }
  return runner->last_reading();
}

std::optional<model::debounce_state> Scheduler::state(const model::source_id id) const {
  const auto* runner = find_enabled(id);
  if (runner == nullptr) {
    return std::nullopt;
  }
  return runner->state();
}

bool Scheduler::in_flight(const model::source_id id) const {
  const auto it = runners_.find(id);
  return it != runners_.end() && it->second->in_flight();
}

bool Scheduler::wait_idle(const model::source_id id, const std::chrono::milliseconds timeout) const {
  const auto it = runners_.find(id);
  if (it == runners_.end()) {
    return true;
  }
  return it->second->wait_idle(timeout);
}

}  // namespace activity_agent::core
