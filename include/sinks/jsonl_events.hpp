#pragma once

#include <cstddef>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

#include "sinks/event_sink.hpp"

namespace activity_agent::sinks {

// One JSON object per line. Every record carries "event", "source" and a
// steady-clock "monotonic_ns".
class JsonlEventSink final : public EventSink {
 public:
  explicit JsonlEventSink(std::ostream& out);
  // Takes ownership of an already opened file.
  explicit JsonlEventSink(std::unique_ptr<std::ofstream> file);

  // "-" selects stderr. Throws std::runtime_error when the file cannot be opened.
  static std::unique_ptr<JsonlEventSink> open(const std::string& path);

  void on_reading(model::source_id id, const model::reading& reading, const model::debounce_state& state) override;
  void on_transition(model::source_id id, model::transition change, const model::reading* cause) override;
  void on_timeout(model::source_id id, std::chrono::milliseconds deadline) override;
  void on_dropped_tick(model::source_id id) override;
  void on_stale_sample(model::source_id id, const model::reading& reading) override;

  [[nodiscard]] std::size_t records_written() const noexcept { return records_written_; }

 private:
  static nlohmann::json to_json(const model::reading& reading);
  nlohmann::json make_record(const char* event, model::source_id id) const;
  void write(const nlohmann::json& record) noexcept;

  std::unique_ptr<std::ofstream> file_{};
  std::ostream* out_;
  std::size_t records_written_{0};
  bool failed_{false};
};

}  // namespace activity_agent::sinks
