#pragma once

#include <string>
#include <vector>

#include "probes/probe.hpp"

namespace activity_agent::probes {

// Pids whose /proc/<pid>/comm equals `name`. comm holds at most 15 characters,
// so longer names are confirmed against the argv[0] basename in cmdline. A
// missing or unreadable proc root yields an empty list.
std::vector<int> find_processes(const std::string& proc_root, const std::string& name);

// Active while a process with the given command name exists. Cheap enough to
// run without a deadline.
class ProcessProbe final : public Probe {
 public:
  explicit ProcessProbe(std::string process_name, std::string proc_root = "/proc");

  model::reading sample(const SampleContext& context) override;

 private:
  std::string process_name_;
  std::string proc_root_;
};

}  // namespace activity_agent::probes
