#include "core/agent.hpp"

#include <iostream>
#include <string>

#include "probes/factory.hpp"

namespace activity_agent::core {
namespace {

std::string redis_address(const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    return "unix://" + redis.unix_socket;
  }
  return redis.host + ':' + std::to_string(redis.port);
}

}  // namespace

Agent::Agent(AgentConfig config)
    : publish_stdout_(config.stdout_debug),
      scheduler_(SchedulerOptions{config.tick_interval}),
      aggregator_(scheduler_) {
  if (!config.diagnostics_path.empty()) {
    diagnostics_sink_ = sinks::JsonlEventSink::open(config.diagnostics_path);
    scheduler_.add_event_sink(diagnostics_sink_.get());
    std::cerr << "[agent] diagnostics events written to " << config.diagnostics_path << '\n';
  }

  register_sources(config);

  if (config.redis.enabled) {
    sinks::RedisActivityOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.password = config.redis.password;
    options.db = config.redis.db;
    options.key_prefix = config.redis.key_prefix;
    options.publish_health = config.publish_health;
    options.sources = scheduler_.registered_sources();
    redis_sink_ = std::make_unique<sinks::RedisActivitySink>(options);

    if (redis_sink_->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed at " << redis_address(config.redis) << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << redis_address(config.redis) << '\n';
    }
  }

  aggregator_.subscribe([this](const model::active_set& active) { publish_sinks(active); });
}

void Agent::register_sources(const AgentConfig& config) {
  for (const auto& [id, source] : config.sources) {
    if (!source.enabled) {
      std::cerr << "[agent] source " << model::to_string(id) << " disabled\n";
      continue;
    }

    auto probe = probes::make_probe(source.probe);
    scheduler_.add_source(id, source.options, std::move(probe));
  }

  if (scheduler_.registered_sources().empty()) {
    std::cerr << "[agent] no sources enabled; the active set will stay empty\n";
  }
}

AgentStats Agent::run_for_ticks(const std::size_t total_ticks) {
  if (!initial_published_) {
    // Seeds every series with 0 so consumers see registered sources before their first transition.
    publish_sinks(aggregator_.active());
    initial_published_ = true;
  }

  const SchedulerStats scheduler_stats = scheduler_.run_for_ticks(total_ticks);
  stats_.ticks_executed = scheduler_stats.ticks_executed;
  stats_.transitions = scheduler_stats.transitions;
  return stats_;
}

void Agent::stop() { scheduler_.stop(); }

void Agent::publish_sinks(const model::active_set& active) {
  ++stats_.publishes;

  if (publish_stdout_) {
    stdout_sink_.publish(active);
  }

  if (redis_sink_ != nullptr) {
    const SchedulerStats& scheduler_stats = scheduler_.stats();
    sinks::ActivityHealth health{};
    health.dropped_ticks = scheduler_stats.polls_dropped;
    health.timeouts = scheduler_stats.timeouts;

    const bool ok = redis_sink_->publish(active, health);
    if (!ok) {
      ++stats_.redis_errors;
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

}  // namespace activity_agent::core
