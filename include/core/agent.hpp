#pragma once

#include <cstddef>
#include <memory>

#include "core/aggregator.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "model/source.hpp"
#include "sinks/jsonl_events.hpp"
#include "sinks/redis_activity.hpp"
#include "sinks/stdout_debug.hpp"

namespace activity_agent::core {

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t transitions{0};
  std::size_t publishes{0};
  std::size_t redis_errors{0};
};

class Agent {
 public:
  // Throws when a configured probe cannot be built or the diagnostics file cannot be opened.
  explicit Agent(AgentConfig config = {});

  Agent(const Agent&) = delete;
  Agent& operator=(const Agent&) = delete;

  // 0 runs until stop().
  AgentStats run_for_ticks(std::size_t total_ticks);
  // Safe to call from any thread.
  void stop();

  [[nodiscard]] Scheduler& scheduler() noexcept { return scheduler_; }
  [[nodiscard]] const Aggregator& aggregator() const noexcept { return aggregator_; }

 private:
  void register_sources(const AgentConfig& config);
  void publish_sinks(const model::active_set& active);

  bool publish_stdout_{true};
  bool initial_published_{false};
  AgentStats stats_{};

  // Sinks are referenced by the scheduler and must outlive it.
  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisActivitySink> redis_sink_{};
  std::unique_ptr<sinks::JsonlEventSink> diagnostics_sink_{};
  bool redis_was_ok_{true};

  Scheduler scheduler_;
  Aggregator aggregator_;
};

}  // namespace activity_agent::core
