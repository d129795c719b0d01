#include "probes/download_probe.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace activity_agent::probes {
namespace {

std::string lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

}  // namespace

DownloadProbe::DownloadProbe(std::string directory, std::vector<std::string> extensions)
    : directory_(std::move(directory)), extensions_(std::move(extensions)) {
  for (auto& extension : extensions_) {
    if (!extension.empty() && extension.front() == '.') {
      extension.erase(0, 1);
    }
    extension = lower(extension);
  }
}

bool DownloadProbe::is_partial(const std::string& extension) const {
  return std::find(extensions_.begin(), extensions_.end(), extension) != extensions_.end();
}

void DownloadProbe::reset() noexcept { previous_sizes_.clear(); }

model::reading DownloadProbe::sample(const SampleContext& context) {
  std::error_code ec;
  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    previous_sizes_.clear();
    return model::inactive_reading(model::reading_origin::SAMPLE, "directory unreadable");
  }

  std::unordered_map<std::string, std::uintmax_t> current;
  std::string growing_file;
  for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    const auto& path = it->path();
    std::string extension = path.extension().string();
    if (!extension.empty()) {
      extension.erase(0, 1);
    }
    if (!is_partial(lower(extension))) {
      continue;
    }

    std::error_code size_ec;
    const auto size = std::filesystem::file_size(path, size_ec);
    if (size_ec) {
      continue;
    }

    const std::string name = path.filename().string();
    current[name] = size;

    // A file seen for the first time gets the benefit of the doubt.
    const auto previous = previous_sizes_.find(name);
    const bool growing = previous == previous_sizes_.end() || size > previous->second;
    if (context.debug) {
      std::cerr << "[probe] download " << name << " size=" << size << (growing ? " growing" : " stalled") << '\n';
    }
    if (growing && growing_file.empty()) {
      growing_file = name;
    }
  }

  previous_sizes_ = std::move(current);
  if (growing_file.empty()) {
    return model::inactive_reading();
  }
  return model::active_reading(growing_file);
}

}  // namespace activity_agent::probes
