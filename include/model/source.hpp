#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace activity_agent::model {

// Stable identities of monitored sources. Values are never reassigned.
enum class source_id : std::uint8_t {
    CLAUDE = 0,
    CLAUDE_APP,
    CODEX,
    OPENCODE,
    XCODE,
    ANDROID_STUDIO,
    FINDER,
    DOWNLOADS,
    DROPBOX,
    GOOGLE_DRIVE,
    ONEDRIVE,
    ICLOUD,
    APP_STORE,
    INSTALLER,
    AUTOMATOR,
    SCRIPT_EDITOR,
    DAVINCI_RESOLVE,
    TEAMS,
    CUSTOM_1,
    CUSTOM_2,
    CUSTOM_3,
    CUSTOM_4,
};

inline constexpr std::size_t kSourceCount = static_cast<std::size_t>(source_id::CUSTOM_4) + 1;

using active_set = std::set<source_id>;

const std::array<source_id, kSourceCount>& all_sources() noexcept;

const char* to_string(source_id id) noexcept;

std::optional<source_id> parse_source_id(std::string_view name) noexcept;

std::string join_names(const active_set& sources, char separator = ',');

}  // namespace activity_agent::model
