#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

#include <clicky/core/log.hpp>
#include <clicky/core/scheduler.hpp>
#include <clicky/core/task_error.hpp>

namespace clicky {

using task_id = std::uint64_t;

namespace detail {
template <class R> struct success_callback { using type = std::function<void(R)>; };
template <> struct success_callback<void> { using type = std::function<void()>; };

// Shared with every worker thread so the dispatcher itself may go away first
struct in_flight_counter {
  mutable std::mutex m;
  std::size_t active{0};

  void enter() {
    std::lock_guard<std::mutex> lock(m);
    ++active;
  }
  void leave() {
    std::lock_guard<std::mutex> lock(m);
    if (active > 0) --active;
  }
  std::size_t get() const {
    std::lock_guard<std::mutex> lock(m);
    return active;
  }
};

struct leave_on_exit {
  std::shared_ptr<in_flight_counter> c;
  ~leave_on_exit() { c->leave(); }
};
} // namespace detail

template <class Work>
using success_callback_t =
  typename detail::success_callback<std::invoke_result_t<std::decay_t<Work>&>>::type;

using error_callback = std::function<void(const task_error&)>;

// General worker: one detached thread per submitted task, no admission control.
// Exactly one of on_success / on_error is posted to the delivery executor per task.
class dispatcher {
public:
  explicit dispatcher(std::shared_ptr<executor> delivery)
    : delivery_(std::move(delivery))
    , counter_(std::make_shared<detail::in_flight_counter>()) {
    if (!delivery_) throw std::invalid_argument("dispatcher: delivery executor is null");
  }

  dispatcher(const dispatcher&) = delete;
  dispatcher& operator=(const dispatcher&) = delete;

  // `work` runs on a new background thread and must not touch foreground-only APIs.
  // Returns without waiting for it.
  template <class Work>
  task_id submit(Work&& work, success_callback_t<Work> on_success, error_callback on_error = {}) {
    using R = std::invoke_result_t<std::decay_t<Work>&>;
    const task_id id = next_id_.fetch_add(1, std::memory_order_relaxed);

    counter_->enter();
    log::get()->debug("task {} submitted ({} in flight)", id, counter_->get());

    std::thread worker;
    try {
      worker = std::thread([id,
                           fn = std::decay_t<Work>(std::forward<Work>(work)),
                           ok = std::move(on_success),
                           err = on_error,
                           delivery = delivery_,
                           counter = counter_]() mutable {
        detail::leave_on_exit guard{counter};
        try {
          // Building the continuation counts as part of the work: if it throws, on_error fires.
          if constexpr (std::is_void_v<R>) {
            fn();
            delivery->post([ok] { if (ok) ok(); });
          } else {
            auto value = std::make_shared<R>(fn());
            delivery->post([ok, value] { if (ok) ok(std::move(*value)); });
          }
          log::get()->debug("task {} finished", id);
        } catch (...) {
          deliver_error(*delivery, id, err, capture_current_error());
        }
      });
    } catch (...) {
      // Copying the work or starting the thread failed: the task never ran.
      // Still report exactly once, and undo the count.
      counter_->leave();
      deliver_error(*delivery_, id, on_error, capture_current_error());
      return id;
    }
    worker.detach();
    return id;
  }

  // True while any submitted work has not finished yet
  bool is_busy() const { return counter_->get() > 0; }

  std::size_t in_flight() const { return counter_->get(); }

private:
  static void deliver_error(executor& delivery, task_id id, const error_callback& err, task_error e) {
    log::get()->debug("task {} failed: {}", id, e.message);
    try {
      delivery.post([err, e = std::move(e)] { if (err) err(e); });
    } catch (const std::exception& pe) {
      log::get()->error("task {}: failure could not be delivered: {}", id, pe.what());
    } catch (...) {
      log::get()->error("task {}: failure could not be delivered: non-standard exception", id);
    }
  }

  std::shared_ptr<executor> delivery_;
  std::shared_ptr<detail::in_flight_counter> counter_;
  std::atomic<task_id> next_id_{1};
};

} // namespace clicky
