#include "model/reading.hpp"

namespace activity_agent::model {

const char* to_string(const reading_state state) noexcept {
  switch (state) {
    case reading_state::INACTIVE:
      return "inactive";
    case reading_state::ACTIVE:
      return "active";
    case reading_state::NEUTRAL:
      return "neutral";
  }
  return "unknown";
}

const char* to_string(const reading_origin origin) noexcept {
  switch (origin) {
    case reading_origin::SAMPLE:
      return "sample";
    case reading_origin::PRECHECK:
      return "precheck";
    case reading_origin::TIMEOUT:
      return "timeout";
    case reading_origin::FAILURE:
      return "failure";
  }
  return "unknown";
}

}  // namespace activity_agent::model
