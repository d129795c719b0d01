#pragma once

#include <cstdio>

#include "model/source.hpp"

namespace activity_agent::sinks {

class StdoutDebugSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) : out_(out) {}

  void publish(const model::active_set& active) const;

 private:
  std::FILE* out_;
};

}  // namespace activity_agent::sinks
