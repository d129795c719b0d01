#include "core/worker_lane.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace activity_agent::core {
namespace {

// Frees the task slot however the task exits.
class TaskSlotRelease {
 public:
  TaskSlotRelease(std::mutex& mutex, bool& running, std::condition_variable& idle)
      : mutex_(mutex), running_(running), idle_(idle) {}
  ~TaskSlotRelease() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
    }
    idle_.notify_all();
  }

  TaskSlotRelease(const TaskSlotRelease&) = delete;
  TaskSlotRelease& operator=(const TaskSlotRelease&) = delete;

 private:
  std::mutex& mutex_;
  bool& running_;
  std::condition_variable& idle_;
};

}  // namespace

WorkerLane::WorkerLane(std::string name) : name_(std::move(name)), thread_(&WorkerLane::run, this) {}

WorkerLane::~WorkerLane() { stop(); }

bool WorkerLane::try_submit(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_ || running_task_ || pending_) {
      return false;
    }
    pending_ = std::move(task);
  }
  wake_.notify_one();
  return true;
}

bool WorkerLane::busy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_task_ || static_cast<bool>(pending_);
}

bool WorkerLane::wait_idle(const std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_.wait_for(lock, timeout, [this] { return !running_task_ && !pending_; });
}

void WorkerLane::stop() noexcept {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
    pending_ = nullptr;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void WorkerLane::run() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      wake_.wait(lock, [this] { return stop_requested_ || static_cast<bool>(pending_); });
      if (stop_requested_) {
        break;
      }
      task = std::move(pending_);
      pending_ = nullptr;
      running_task_ = true;
    }

    TaskSlotRelease release(mutex_, running_task_, idle_);
    try {
      task();
    } catch (const std::exception& ex) {
      std::cerr << "[lane:" << name_ << "] task failed: " << ex.what() << '\n';
    }
  }

  idle_.notify_all();
}

}  // namespace activity_agent::core
