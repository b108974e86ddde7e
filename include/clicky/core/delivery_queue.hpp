#pragma once
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>

#include <clicky/core/log.hpp>
#include <clicky/core/scheduler.hpp>

namespace clicky {

// Unbounded FIFO of continuations. Any thread may post; only the foreground
// thread drains (see foreground_pump). Producers never run what they post.
class delivery_queue final : public executor {
public:
  delivery_queue() = default;
  delivery_queue(const delivery_queue&) = delete;
  delivery_queue& operator=(const delivery_queue&) = delete;

  void post(std::function<void()> f) override {
    std::lock_guard<std::mutex> lock(m_);
    q_.push(std::move(f));
  }

  void push(std::function<void()> f) { post(std::move(f)); }

  // Pops and runs until the queue is really empty, including continuations
  // posted by the ones being run. The lock is never held while a continuation runs.
  std::size_t drain_and_run() {
    std::size_t ran = 0;
    for (;;) {
      std::function<void()> f;
      {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty()) break;
        f = std::move(q_.front());
        q_.pop();
      }
      ++ran;
      if (!f) continue;
      try {
        f();
      } catch (const std::exception& e) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        log::get()->error("continuation threw: {}", e.what());
      } catch (...) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        log::get()->error("continuation threw a non-standard exception");
      }
    }
    return ran;
  }

  bool empty() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.empty();
  }

  // Snapshot; may be stale by the time the caller looks at it
  std::size_t pending() const {
    std::lock_guard<std::mutex> lock(m_);
    return q_.size();
  }

  // Continuations that threw during a drain, over the queue's lifetime
  std::size_t failures() const noexcept {
    return failures_.load(std::memory_order_relaxed);
  }

private:
  mutable std::mutex m_;
  std::queue<std::function<void()>> q_;
  std::atomic<std::size_t> failures_{0};
};

} // namespace clicky
