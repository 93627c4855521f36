#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace clusterboot {

// Shared stop flag. Waiters wake as soon as cancel() is called.
class CancellationSignal {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
  }

  // Returns true when cancelled before the duration elapsed.
  template <typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, d, [this] { return cancelled_; });
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_{false};
};

} // namespace clusterboot
