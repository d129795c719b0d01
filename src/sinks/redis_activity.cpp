#include "sinks/redis_activity.hpp"

#include "core/timestamp.hpp"

#include <cstddef>
#include <cstring>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

namespace activity_agent::sinks {
namespace {

constexpr const char* kActiveCountSuffix = "agent:active_count";
constexpr const char* kHeartbeatSuffix = "agent:heartbeat";
constexpr const char* kDroppedTicksSuffix = "agent:dropped_ticks";
constexpr const char* kTimeoutsSuffix = "agent:timeouts";

void add_metric_args(std::vector<std::string>& args, const std::string& key, const std::uint64_t timestamp_ms,
                     const double value) {
  args.emplace_back(key);
  args.emplace_back(std::to_string(timestamp_ms));
  args.emplace_back(std::to_string(value));
}

std::string source_key(const std::string& prefix, const model::source_id id) {
  return prefix + ":source:" + model::to_string(id);
}

}  // namespace

RedisActivitySink::RedisActivitySink(RedisActivityOptions options) : options_(std::move(options)) {
  for (const auto id : options_.sources) {
    series_keys_.push_back(source_key(options_.key_prefix, id));
  }
  series_keys_.push_back(options_.key_prefix + ":" + kActiveCountSuffix);
  if (options_.publish_health) {
    series_keys_.push_back(options_.key_prefix + ":" + kHeartbeatSuffix);
    series_keys_.push_back(options_.key_prefix + ":" + kDroppedTicksSuffix);
    series_keys_.push_back(options_.key_prefix + ":" + kTimeoutsSuffix);
  }
  reserve_command_buffers();
}

RedisActivitySink::~RedisActivitySink() = default;

RedisActivitySink::RedisActivitySink(RedisActivitySink&&) noexcept = default;
RedisActivitySink& RedisActivitySink::operator=(RedisActivitySink&&) noexcept = default;

bool RedisActivitySink::check_connectivity() {
  return ensure_connected();
}

void RedisActivitySink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisActivitySink::ensure_connected() {
  if (!timeseries_available_) {
    return false;
  }

  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisActivitySink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db() || !ensure_schema()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisActivitySink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisActivitySink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisActivitySink::ensure_schema() {
  if (schema_ready_) {
    return true;
  }

  for (const auto& key : series_keys_) {
    redisReply* reply = static_cast<redisReply*>(
        redisCommand(context_.get(), "TS.CREATE %s DUPLICATE_POLICY LAST", key.c_str()));
    if (reply == nullptr) {
      return false;
    }

    const bool already_exists =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "already exists") != nullptr;
    const bool unknown_command =
        reply->type == REDIS_REPLY_ERROR && reply->str != nullptr && strstr(reply->str, "unknown command") != nullptr;
    const bool ok = reply->type != REDIS_REPLY_ERROR || already_exists;
    const std::string reply_message = reply->str != nullptr ? reply->str : "unknown";
    freeReplyObject(reply);

    if (unknown_command) {
      std::cerr << "[redis] RedisTimeSeries module not available (TS.CREATE unknown command)\n";
      timeseries_available_ = false;
      return false;
    }
    if (!ok) {
      std::cerr << "[redis] schema error on TS.CREATE " << key << ": " << reply_message << '\n';
      return false;
    }
  }

  schema_ready_ = true;
  return true;
}

bool RedisActivitySink::publish(const model::active_set& active, const ActivityHealth& health) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(active, health)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(active, health);
}

bool RedisActivitySink::publish_impl(const model::active_set& active, const ActivityHealth& health) {
  const std::uint64_t timestamp_ms = core::unix_timestamp_now_ms();

  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();
  command_args_.emplace_back("TS.MADD");

  for (std::size_t i = 0; i < options_.sources.size(); ++i) {
    const bool is_active = active.count(options_.sources[i]) != 0;
    add_metric_args(command_args_, series_keys_[i], timestamp_ms, is_active ? 1.0 : 0.0);
  }
  add_metric_args(command_args_, options_.key_prefix + ":" + kActiveCountSuffix, timestamp_ms,
                  static_cast<double>(active.size()));

  if (options_.publish_health) {
    add_metric_args(command_args_, options_.key_prefix + ":" + kHeartbeatSuffix, timestamp_ms,
                    static_cast<double>(timestamp_ms));
    add_metric_args(command_args_, options_.key_prefix + ":" + kDroppedTicksSuffix, timestamp_ms,
                    static_cast<double>(health.dropped_ticks));
    add_metric_args(command_args_, options_.key_prefix + ":" + kTimeoutsSuffix, timestamp_ms,
                    static_cast<double>(health.timeouts));
  }

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

void RedisActivitySink::reserve_command_buffers() {
  const std::size_t arg_count = 1 + (series_keys_.size() * 3);
  command_args_.reserve(arg_count);
  command_argv_.reserve(arg_count);
  command_argv_len_.reserve(arg_count);
}

}  // namespace activity_agent::sinks
