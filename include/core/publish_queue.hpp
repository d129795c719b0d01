#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace activity_agent::core {

// Mailbox of the publishing thread. Any thread may post; only the thread that
// drives run_pending()/run_until() executes tasks.
class PublishQueue {
 public:
  void post(std::function<void()> task);

  std::size_t run_pending();

  // Executes tasks as they arrive until `until` passes or interrupt() is called.
  std::size_t run_until(std::chrono::steady_clock::time_point until);

  void interrupt();

  [[nodiscard]] std::size_t size() const;

 private:
  bool pop(std::function<void()>& task);

  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::deque<std::function<void()>> tasks_{};
  bool interrupted_{false};
};

}  // namespace activity_agent::core
