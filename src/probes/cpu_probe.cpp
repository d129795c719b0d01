#include "probes/cpu_probe.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "probes/process_probe.hpp"

namespace activity_agent::probes {
namespace {

// utime and stime are fields 14 and 15; counted from the state field after ')'.
constexpr std::size_t kUtimeOffset = 11;
constexpr std::size_t kStimeOffset = 12;

std::string format_pct(const float value) {
  char buffer[32]{};
  std::snprintf(buffer, sizeof(buffer), "cpu=%.1f%%", static_cast<double>(value));
  return buffer;
}

}  // namespace

CpuProbe::CpuProbe(std::string process_name, const float low_pct, const float high_pct, std::string proc_root,
                   const long clock_ticks_per_second)
    : process_name_(std::move(process_name)),
      low_pct_(low_pct),
      high_pct_(high_pct),
      proc_root_(std::move(proc_root)),
      clock_ticks_per_second_(clock_ticks_per_second > 0 ? clock_ticks_per_second : sysconf(_SC_CLK_TCK)) {
  if (process_name_.empty()) {
    throw std::invalid_argument("cpu probe requires a process name");
  }
  if (low_pct_ < 0.0F || high_pct_ < low_pct_) {
    throw std::invalid_argument("cpu probe requires 0 <= cpu_low <= cpu_high");
  }
  if (clock_ticks_per_second_ <= 0) {
    clock_ticks_per_second_ = 100;
  }
}

bool CpuProbe::available() noexcept { return !find_processes(proc_root_, process_name_).empty(); }

void CpuProbe::reset() noexcept {
  prev_ticks_.clear();
  prev_uptime_.reset();
  last_cpu_pct_.reset();
}

bool CpuProbe::read_uptime(double& seconds) const {
  std::ifstream input(proc_root_ + "/uptime");
  if (!input.is_open()) {
    return false;
  }
  input >> seconds;
  return static_cast<bool>(input);
}

bool CpuProbe::read_process_ticks(const int pid, std::uint64_t& ticks) const {
  std::ifstream input(proc_root_ + "/" + std::to_string(pid) + "/stat");
  std::string line;
  if (!input.is_open() || !std::getline(input, line)) {
    return false;
  }

  const auto close_paren = line.rfind(')');
  if (close_paren == std::string::npos) {
    return false;
  }

  std::istringstream fields(line.substr(close_paren + 1));
  std::vector<std::string> tokens;
  std::string token;
  while (fields >> token) {
    tokens.push_back(token);
  }
  if (tokens.size() <= kStimeOffset) {
    return false;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long long utime = std::strtoull(tokens[kUtimeOffset].c_str(), &end, 10);
  if (errno != 0 || end == tokens[kUtimeOffset].c_str()) {
    return false;
  }
  const unsigned long long stime = std::strtoull(tokens[kStimeOffset].c_str(), &end, 10);
  if (errno != 0 || end == tokens[kStimeOffset].c_str()) {
    return false;
  }
  ticks = static_cast<std::uint64_t>(utime + stime);
  return true;
}

model::reading CpuProbe::sample(const SampleContext& context) {
  double uptime = 0.0;
  if (!read_uptime(uptime)) {
    return model::inactive_reading(model::reading_origin::FAILURE, "uptime unreadable");
  }

  std::unordered_map<int, std::uint64_t> current;
  std::uint64_t delta_ticks = 0;
  for (const int pid : find_processes(proc_root_, process_name_)) {
    std::uint64_t ticks = 0;
    if (!read_process_ticks(pid, ticks)) {
      continue;
    }
    current[pid] = ticks;
    const auto prev = prev_ticks_.find(pid);
    if (prev != prev_ticks_.end() && ticks >= prev->second) {
      delta_ticks += ticks - prev->second;
    }
  }

  const std::optional<double> prev_uptime = prev_uptime_;
  prev_ticks_ = std::move(current);
  prev_uptime_ = uptime;

  if (!prev_uptime.has_value() || uptime <= *prev_uptime) {
    return model::neutral_reading("baseline");
  }

  const double elapsed = uptime - *prev_uptime;
  const float cpu_pct = static_cast<float>(
      (static_cast<double>(delta_ticks) / static_cast<double>(clock_ticks_per_second_)) / elapsed * 100.0);
  last_cpu_pct_ = cpu_pct;

  if (context.debug) {
    std::cerr << "[probe] " << process_name_ << ' ' << format_pct(cpu_pct) << " band=[" << low_pct_ << ','
              << high_pct_ << "]\n";
  }

  if (cpu_pct >= high_pct_) {
    return model::active_reading(format_pct(cpu_pct));
  }
  if (cpu_pct < low_pct_) {
    return model::inactive_reading(model::reading_origin::SAMPLE, format_pct(cpu_pct));
  }
  return model::neutral_reading(format_pct(cpu_pct));
}

}  // namespace activity_agent::probes
