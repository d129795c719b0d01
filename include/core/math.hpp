#pragma once

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <string>

namespace activity_agent::core {

inline constexpr float clamp01(const float value) noexcept {
  return std::clamp(value, 0.0F, 1.0F);
}

// "42", "42%" or "42.5" as a fraction in [0,1]; nullopt when not numeric.
inline std::optional<float> parse_percent_fraction(const std::string& text) noexcept {
  const char* begin = text.c_str();
  char* end = nullptr;
  const float parsed = std::strtof(begin, &end);
  if (end == begin || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return clamp01(parsed / 100.0F);
}

}  // namespace activity_agent::core
