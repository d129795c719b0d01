#include "sinks/stdout_debug.hpp"

#include <string>

namespace activity_agent::sinks {

void StdoutDebugSink::publish(const model::active_set& active) const {
  const std::string names = active.empty() ? std::string("(none)") : model::join_names(active);
  std::fprintf(out_, "[active] %s\n", names.c_str());
  std::fflush(out_);
}

}  // namespace activity_agent::sinks
