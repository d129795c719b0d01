#include "core/publish_queue.hpp"

#include <utility>

namespace activity_agent::core {

void PublishQueue::post(std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
  }
  ready_.notify_one();
}

bool PublishQueue::pop(std::function<void()>& task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (tasks_.empty()) {
    return false;
  }
  task = std::move(tasks_.front());
  tasks_.pop_front();
  return true;
}

std::size_t PublishQueue::run_pending() {
  std::size_t executed = 0;
  std::function<void()> task;
  while (pop(task)) {
    task();
    ++executed;
  }
  return executed;
}

std::size_t PublishQueue::run_until(const std::chrono::steady_clock::time_point until) {
  std::size_t executed = 0;
  while (true) {
    executed += run_pending();

    std::unique_lock<std::mutex> lock(mutex_);
    const bool woke = ready_.wait_until(lock, until, [this] { return interrupted_ || !tasks_.empty(); });
    if (!woke || interrupted_) {
      interrupted_ = false;
      lock.unlock();
      executed += run_pending();
      return executed;
    }
  }
}

void PublishQueue::interrupt() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    interrupted_ = true;
  }
  ready_.notify_all();
}

std::size_t PublishQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

}  // namespace activity_agent::core
