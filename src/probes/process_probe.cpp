#include "probes/process_probe.hpp"

#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

namespace activity_agent::probes {
namespace {

// TASK_COMM_LEN minus the terminator.
constexpr std::size_t kCommMaxLength = 15;

bool is_pid_directory(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  for (const char c : name) {
    if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
      return false;
    }
  }
  return true;
}

// Basename of argv[0] from /proc/<pid>/cmdline; empty for kernel threads.
std::string executable_name(const std::filesystem::path& pid_dir) {
  std::ifstream cmdline(pid_dir / "cmdline", std::ios::binary);
  std::string argv0;
  if (!cmdline.is_open() || !std::getline(cmdline, argv0, '\0')) {
    return {};
  }
  const auto slash = argv0.rfind('/');
  return slash == std::string::npos ? argv0 : argv0.substr(slash + 1);
}

bool command_matches(const std::filesystem::path& pid_dir, const std::string& command, const std::string& name) {
  if (command == name) {
    return true;
  }
  if (name.size() <= kCommMaxLength || command != name.substr(0, kCommMaxLength)) {
    return false;
  }
  return executable_name(pid_dir) == name;
}

}  // namespace

std::vector<int> find_processes(const std::string& proc_root, const std::string& name) {
  std::vector<int> pids;
  std::error_code ec;
  std::filesystem::directory_iterator it(proc_root, ec);
  if (ec) {
    return pids;
  }

  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    const std::string entry = it->path().filename().string();
    if (!is_pid_directory(entry)) {
      continue;
    }

    std::ifstream comm(it->path() / "comm");
    std::string command;
    if (!comm.is_open() || !std::getline(comm, command)) {
      continue;
    }
    if (command_matches(it->path(), command, name)) {
      pids.push_back(static_cast<int>(std::strtol(entry.c_str(), nullptr, 10)));
    }
  }
  return pids;
}

ProcessProbe::ProcessProbe(std::string process_name, std::string proc_root)
    : process_name_(std::move(process_name)), proc_root_(std::move(proc_root)) {}

model::reading ProcessProbe::sample(const SampleContext& context) {
  const auto pids = find_processes(proc_root_, process_name_);
  if (context.debug) {
    std::cerr << "[probe] process " << process_name_ << " matches=" << pids.size() << '\n';
  }
  if (pids.empty()) {
    return model::inactive_reading(model::reading_origin::SAMPLE, process_name_ + " not running");
  }
  return model::active_reading(process_name_ + " running");
}

}  // namespace activity_agent::probes
