#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace activity_agent::core {

// One dedicated worker thread with a single task slot. Submissions while a task
// is pending or running are refused rather than queued.
class WorkerLane {
 public:
  explicit WorkerLane(std::string name);
  ~WorkerLane();

  WorkerLane(const WorkerLane&) = delete;
  WorkerLane& operator=(const WorkerLane&) = delete;

  bool try_submit(std::function<void()> task);

  [[nodiscard]] bool busy() const;
  bool wait_idle(std::chrono::milliseconds timeout) const;

  // Finishes the running task, drops a pending one and joins.
  void stop() noexcept;

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

 private:
  void run();

  std::string name_;
  mutable std::mutex mutex_;
  mutable std::condition_variable wake_;
  mutable std::condition_variable idle_;
  std::function<void()> pending_{};
  bool running_task_{false};
  bool stop_requested_{false};
  std::thread thread_;
};

}  // namespace activity_agent::core
