#include "model/source.hpp"

namespace activity_agent::model {
namespace {

constexpr std::array<const char*, kSourceCount> kSourceNames = {
    "claude",       "claude_app",    "codex",         "opencode",        "xcode",    "android_studio",
    "finder",       "downloads",     "dropbox",       "google_drive",    "onedrive", "icloud",
    "app_store",    "installer",     "automator",     "script_editor",   "davinci_resolve",
    "teams",        "custom_1",      "custom_2",      "custom_3",        "custom_4",
};

}  // namespace

const std::array<source_id, kSourceCount>& all_sources() noexcept {
  static const std::array<source_id, kSourceCount> kAll = [] {
    std::array<source_id, kSourceCount> ids{};
    for (std::size_t i = 0; i < kSourceCount; ++i) {
      ids[i] = static_cast<source_id>(i);
    }
    return ids;
  }();
  return kAll;
}

const char* to_string(const source_id id) noexcept {
  const auto index = static_cast<std::size_t>(id);
  if (index >= kSourceCount) {
    return "unknown";
  }
  return kSourceNames[index];
}

std::optional<source_id> parse_source_id(const std::string_view name) noexcept {
  for (std::size_t i = 0; i < kSourceCount; ++i) {
    if (name == kSourceNames[i]) {
      return static_cast<source_id>(i);
    }
  }
  return std::nullopt;
}

std::string join_names(const active_set& sources, const char separator) {
  std::string out;
  for (const auto id : sources) {
    if (!out.empty()) {
      out.push_back(separator);
    }
    out += to_string(id);
  }
  return out;
}

}  // namespace activity_agent::model
