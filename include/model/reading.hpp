#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace activity_agent::model {

enum class reading_state : std::uint8_t {
    INACTIVE = 0,
    ACTIVE = 1,
    // Between a rich probe's activate and deactivate bands; carries no vote.
    NEUTRAL = 2,
};

// Where a reading came from. Everything except SAMPLE is synthesized by the runner.
enum class reading_origin : std::uint8_t {
    SAMPLE = 0,
    PRECHECK = 1,
    TIMEOUT = 2,
    FAILURE = 3,
};

struct reading {
    reading_state state{reading_state::INACTIVE};
    reading_origin origin{reading_origin::SAMPLE};
    std::optional<float> progress{};
    std::string detail{};
    std::uint64_t monotonic_ns{0};

    [[nodiscard]] bool active() const noexcept { return state == reading_state::ACTIVE; }
};

inline reading active_reading(std::string detail = {}) {
    reading r{};
    r.state = reading_state::ACTIVE;
    r.detail = std::move(detail);
    return r;
}

inline reading inactive_reading(const reading_origin origin = reading_origin::SAMPLE, std::string detail = {}) {
    reading r{};
    r.state = reading_state::INACTIVE;
    r.origin = origin;
    r.detail = std::move(detail);
    return r;
}

inline reading neutral_reading(std::string detail = {}) {
    reading r{};
    r.state = reading_state::NEUTRAL;
    r.detail = std::move(detail);
    return r;
}

const char* to_string(reading_state state) noexcept;
const char* to_string(reading_origin origin) noexcept;

// Per-source thresholds, fixed for the lifetime of a registration.
struct debounce_config {
    std::uint32_t required_to_activate{1};
    std::uint32_t required_to_deactivate{3};
};

struct debounce_state {
    std::uint32_t consecutive_active{0};
    std::uint32_t consecutive_inactive{0};
    bool is_active{false};

    bool operator==(const debounce_state& other) const noexcept {
        return consecutive_active == other.consecutive_active && consecutive_inactive == other.consecutive_inactive &&
               is_active == other.is_active;
    }
    bool operator!=(const debounce_state& other) const noexcept { return !(*this == other); }
};

enum class transition : std::uint8_t {
    NONE = 0,
    ACTIVATED = 1,
    DEACTIVATED = 2,
};

}  // namespace activity_agent::model
