#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include <clicky/core/delivery_queue.hpp>

namespace clicky {

// Called once per iteration of the host's render/event loop. Bound to the
// thread that constructs it; that thread is the only one continuations run on.
class foreground_pump {
public:
  explicit foreground_pump(std::shared_ptr<delivery_queue> queue)
    : queue_(std::move(queue)), owner_(std::this_thread::get_id()) {
    if (!queue_) throw std::invalid_argument("foreground_pump: queue is null");
  }

  foreground_pump(const foreground_pump&) = delete;
  foreground_pump& operator=(const foreground_pump&) = delete;

  // Runs everything delivered so far. Returns how many continuations ran.
  std::size_t tick() {
    if (std::this_thread::get_id() != owner_) {
      throw std::logic_error("foreground_pump::tick called off the foreground thread");
    }
    ++ticks_;
    if (queue_->empty()) return 0;
    return queue_->drain_and_run();
  }

  std::thread::id owner() const noexcept { return owner_; }
  std::uint64_t ticks() const noexcept { return ticks_; }
  delivery_queue& queue() noexcept { return *queue_; }

private:
  std::shared_ptr<delivery_queue> queue_;
  std::thread::id owner_;
  std::uint64_t ticks_{0};
};

} // namespace clicky
