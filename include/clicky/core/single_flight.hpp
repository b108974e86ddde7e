#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include <clicky/core/cancel_token.hpp>
#include <clicky/core/log.hpp>
#include <clicky/core/scheduler.hpp>
#include <clicky/core/task_error.hpp>
#include <clicky/core/task_record.hpp>

namespace clicky {

// Cancellable worker for one class of work (query execution): at most one task
// at a time, further submissions are rejected rather than queued.
//
// Cancellation is cooperative. The flag is checked before work starts and again
// after it returns normally; a task cancelled at any point before the second
// check is reported as cancelled and its result dropped. Work that throws is
// reported as failed. Long-running work should poll
// the cancel_token it is given if it wants to stop early.
//
// The task counts as running until its worker has posted everything and is
// about to exit, so on_complete may still see is_running() == true for a moment.
//
// on_complete always goes through the delivery executor. on_progress goes through
// the progress executor, which defaults to the delivery executor (queued, so
// on_complete is always the last callback of a task). Pass inline_executor to
// get progress directly on the worker thread instead.
template <class T>
class single_flight {
  static_assert(!std::is_void_v<T>, "single_flight needs a result type");

public:
  using record_type = task_record<T>;
  using complete_fn = std::function<void(const record_type&)>;
  using progress_fn = std::function<void(const std::string&)>;

  explicit single_flight(std::shared_ptr<executor> delivery,
                         std::shared_ptr<executor> progress = nullptr)
    : delivery_(std::move(delivery))
    , progress_(progress ? std::move(progress) : delivery_) {
    if (!delivery_) throw std::invalid_argument("single_flight: delivery executor is null");
  }

  single_flight(const single_flight&) = delete;
  single_flight& operator=(const single_flight&) = delete;

  // The worker touches this object until it finishes, so wait for it.
  ~single_flight() {
    {
      std::lock_guard<std::mutex> lock(m_);
      if (alive_) cancel_->store(true, std::memory_order_release);
    }
    if (worker_.joinable()) worker_.join();
  }

  // `work` is T() or T(const cancel_token&). Returns false, and starts nothing,
  // while the previous task is still running.
  template <class Work>
  bool execute_async(Work&& work, complete_fn on_complete, progress_fn on_progress = {}) {
    std::thread previous;
    {
      std::lock_guard<std::mutex> lock(m_);
      if (alive_) {
        log::get()->warn("task {} still running, submission rejected", record_.id);
        return false;
      }
      // Claim the slot before letting go of the lock
      alive_ = true;
      previous = std::move(worker_);
      cancel_->store(false, std::memory_order_release);
      record_ = record_type{};
      record_.id = ++last_id_;
      record_.status = task_status::running;
    }
    // The previous worker cleared alive_ as its very last step; only its exit remains
    if (previous.joinable()) previous.join();

    std::unique_lock<std::mutex> lock(m_);
    try {
      // on_complete is copied: it is still needed below if the thread never starts
      worker_ = std::thread(&single_flight::run, this,
                            bind_work(std::forward<Work>(work)),
                            on_complete, std::move(on_progress));
    } catch (...) {
      // Copying the work or starting the thread failed: report it as a failed task
      const task_error e = capture_current_error();
      alive_ = false;
      record_.status = task_status::failed;
      record_.error = e.message;
      const record_type failed = record_;
      lock.unlock();
      log::get()->error("task {}: worker thread could not start: {}", failed.id, e.message);
      deliver_complete(on_complete, failed);
      return true;
    }
    log::get()->debug("task {} started", record_.id);
    return true;
  }

  // Flags the running task as cancelled. Returns false if nothing is running
  // or its outcome is already decided.
  bool cancel_current() {
    std::lock_guard<std::mutex> lock(m_);
    if (!alive_ || record_.terminal()) return false;
    cancel_->store(true, std::memory_order_release);
    log::get()->warn("task {} cancellation requested", record_.id);
    return true;
  }

  bool is_running() const {
    std::lock_guard<std::mutex> lock(m_);
    return alive_;
  }

  record_type current() const {
    std::lock_guard<std::mutex> lock(m_);
    return record_;
  }

  cancel_token token() const { return cancel_token(cancel_); }

private:
  using clock = std::chrono::steady_clock;
  using bound_work = std::function<T(const cancel_token&)>;

  template <class Work>
  static bound_work bind_work(Work&& work) {
    using W = std::decay_t<Work>;
    if constexpr (std::is_invocable_r_v<T, W&, const cancel_token&>) {
      return bound_work(std::forward<Work>(work));
    } else {
      static_assert(std::is_invocable_r_v<T, W&>, "work must be T() or T(const cancel_token&)");
      return [fn = W(std::forward<Work>(work))](const cancel_token&) mutable { return fn(); };
    }
  }

  void run(bound_work work, complete_fn on_complete, progress_fn on_progress) {
    const auto started = clock::now();
    const cancel_token tok(cancel_);
    notify(on_progress, "Executing query...");

    std::optional<T> value;
    std::optional<task_error> error;
    const bool cancelled_early = tok.cancelled();
    if (!cancelled_early) {
      try {
        value.emplace(work(tok));
      } catch (...) {
        error = capture_current_error();
      }
    }
    const std::chrono::duration<double> elapsed = clock::now() - started;

    record_type done;
    {
      std::lock_guard<std::mutex> lock(m_);
      record_.elapsed = elapsed;
      if (cancelled_early) {
        record_.status = task_status::cancelled;
      } else if (error) {
        record_.status = task_status::failed;
        record_.error = error->message;
      } else if (tok.cancelled()) {
        // Work returned, but a cancellation came in meanwhile: drop the result
        record_.status = task_status::cancelled;
      } else {
        record_.status = task_status::completed;
        record_.result = std::move(value);
      }
      done = record_;
    }

    switch (done.status) {
      case task_status::cancelled:
        log::get()->warn("task {} cancelled{}", done.id, cancelled_early ? " before start" : "");
        break;
      case task_status::failed:
        log::get()->debug("task {} failed: {}", done.id, *done.error);
        notify(on_progress, fmt::format("Query failed: {}", *done.error));
        break;
      default:
        log::get()->debug("task {} completed in {:.3f}s", done.id, elapsed.count());
        notify(on_progress, fmt::format("Query completed in {:.2f}s", elapsed.count()));
        break;
    }
    deliver_complete(on_complete, done);

    // Last step: from here on the thread only exits
    std::lock_guard<std::mutex> lock(m_);
    alive_ = false;
  }

  void notify(const progress_fn& on_progress, std::string text) {
    if (!on_progress) return;
    try {
      progress_->post([on_progress, text = std::move(text)] { on_progress(text); });
    } catch (const std::exception& e) {
      log::get()->warn("progress update dropped: {}", e.what());
    } catch (...) {
      log::get()->warn("progress update dropped: non-standard exception");
    }
  }

  void deliver_complete(const complete_fn& on_complete, const record_type& rec) {
    if (!on_complete) return;
    try {
      delivery_->post([on_complete, rec] { on_complete(rec); });
    } catch (const std::exception& e) {
      log::get()->error("task {}: completion could not be delivered: {}", rec.id, e.what());
    } catch (...) {
      log::get()->error("task {}: completion could not be delivered: non-standard exception", rec.id);
    }
  }

  std::shared_ptr<executor> delivery_;
  std::shared_ptr<executor> progress_;
  std::shared_ptr<std::atomic<bool>> cancel_ = std::make_shared<std::atomic<bool>>(false);

  mutable std::mutex m_;
  record_type record_{};
  std::uint64_t last_id_{0};
  bool alive_{false};
  std::thread worker_;
};

} // namespace clicky
