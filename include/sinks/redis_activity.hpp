#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/source.hpp"

struct redisContext;

namespace activity_agent::sinks {

struct RedisActivityOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"activity:node"};
  std::uint32_t connect_timeout_ms{1000};
  bool publish_health{true};
  // Every registered source gets a 0/1 series, active or not.
  std::vector<model::source_id> sources{};
};

struct ActivityHealth {
  std::uint64_t dropped_ticks{0};
  std::uint64_t timeouts{0};
};

class RedisActivitySink {
 public:
  explicit RedisActivitySink(RedisActivityOptions options = {});
  ~RedisActivitySink();

  RedisActivitySink(const RedisActivitySink&) = delete;
  RedisActivitySink& operator=(const RedisActivitySink&) = delete;
  RedisActivitySink(RedisActivitySink&&) noexcept;
  RedisActivitySink& operator=(RedisActivitySink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::active_set& active, const ActivityHealth& health = {});

  [[nodiscard]] const std::vector<std::string>& series_keys() const noexcept { return series_keys_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::active_set& active, const ActivityHealth& health);
  void reserve_command_buffers();

  RedisActivityOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> series_keys_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace activity_agent::sinks
