#include "sinks/jsonl_events.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"

namespace activity_agent::sinks {

JsonlEventSink::JsonlEventSink(std::ostream& out) : out_(&out) {}

JsonlEventSink::JsonlEventSink(std::unique_ptr<std::ofstream> file) : file_(std::move(file)), out_(file_.get()) {}

std::unique_ptr<JsonlEventSink> JsonlEventSink::open(const std::string& path) {
  if (path == "-") {
    return std::make_unique<JsonlEventSink>(std::cerr);
  }

  auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
  if (!file->is_open()) {
    throw std::runtime_error("unable to open diagnostics file: " + path);
  }
  return std::make_unique<JsonlEventSink>(std::move(file));
}

nlohmann::json JsonlEventSink::to_json(const model::reading& reading) {
  nlohmann::json out{
      {"state", model::to_string(reading.state)},
      {"origin", model::to_string(reading.origin)},
      {"detail", reading.detail},
      {"sampled_ns", reading.monotonic_ns},
  };
  if (reading.progress.has_value()) {
    out["progress"] = *reading.progress;
  } else {
    out["progress"] = nullptr;
  }
  return out;
}

nlohmann::json JsonlEventSink::make_record(const char* event, const model::source_id id) const {
  return nlohmann::json{
      {"event", event},
      {"source", model::to_string(id)},
      {"monotonic_ns", core::monotonic_timestamp_now_ns()},
  };
}

void JsonlEventSink::on_reading(const model::source_id id, const model::reading& reading,
                                const model::debounce_state& state) {
  auto record = make_record("reading", id);
  record["reading"] = to_json(reading);
  record["consecutive_active"] = state.consecutive_active;
  record["consecutive_inactive"] = state.consecutive_inactive;
  record["active"] = state.is_active;
  write(record);
}

void JsonlEventSink::on_transition(const model::source_id id, const model::transition change,
                                   const model::reading* cause) {
  auto record = make_record("transition", id);
  record["active"] = change == model::transition::ACTIVATED;
  record["cause"] = cause != nullptr ? to_json(*cause) : nlohmann::json(nullptr);
  write(record);
}

void JsonlEventSink::on_timeout(const model::source_id id, const std::chrono::milliseconds deadline) {
  auto record = make_record("timeout", id);
  record["deadline_ms"] = deadline.count();
  write(record);
}

void JsonlEventSink::on_dropped_tick(const model::source_id id) {
  write(make_record("dropped_tick", id));
}

void JsonlEventSink::on_stale_sample(const model::source_id id, const model::reading& reading) {
  auto record = make_record("stale_sample", id);
  record["reading"] = to_json(reading);
  write(record);
}

void JsonlEventSink::write(const nlohmann::json& record) noexcept {
  try {
    // Probe output is not guaranteed to be valid UTF-8.
    *out_ << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    out_->flush();
  } catch (const std::exception& ex) {
    std::cerr << "[diagnostics] encode failed: " << ex.what() << '\n';
    return;
  }

  if (!*out_) {
    if (!failed_) {
      std::cerr << "[diagnostics] write failed\n";
      failed_ = true;
    }
    return;
  }
  failed_ = false;
  ++records_written_;
}

}  // namespace activity_agent::sinks
