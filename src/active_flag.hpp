#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Process-wide "keep running" flag. Loops poll active() between blocking
// operations and use sleep_for() instead of std::this_thread::sleep_for so that
// stop() wakes them immediately.
class ActiveFlag {
public:
  bool active() const { return active_.load(std::memory_order_acquire); }

  void stop() {
    {
      std::lock_guard<std::mutex> lock(m_);
      active_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
  }

  void reset() {
    std::lock_guard<std::mutex> lock(m_);
    active_.store(true, std::memory_order_release);
  }

  // Returns false if the flag was cleared while waiting.
  template<typename Rep, typename Period>
  bool sleep_for(std::chrono::duration<Rep, Period> duration) {
    std::unique_lock<std::mutex> lock(m_);
    cv_.wait_for(lock, duration, [this]{ return !active(); });
    return active();
  }

private:
  std::atomic<bool> active_{true};
  std::mutex m_;
  std::condition_variable cv_;
};
