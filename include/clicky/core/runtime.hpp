#pragma once
#include <memory>
#include <utility>

#include <clicky/core/config.hpp>
#include <clicky/core/delivery_queue.hpp>
#include <clicky/core/dispatcher.hpp>
#include <clicky/core/log.hpp>
#include <clicky/core/pump.hpp>
#include <clicky/core/single_flight.hpp>
#include <clicky/core/status_board.hpp>

namespace clicky {

// Everything the panels of one application share. Constructed by the
// application root on the foreground thread and passed down by reference.
class runtime {
public:
  explicit runtime(options opts = {})
    : opts_(std::move(opts))
    , queue_(std::make_shared<delivery_queue>())
    , pump_(queue_)
    , dispatcher_(queue_) {
    log::configure(opts_);
  }

  runtime(const runtime&) = delete;
  runtime& operator=(const runtime&) = delete;

  // One call per host loop iteration
  std::size_t tick() { return pump_.tick(); }

  template <class T>
  std::unique_ptr<single_flight<T>> make_single_flight() {
    return std::make_unique<single_flight<T>>(queue_);
  }

  const options& config() const noexcept { return opts_; }
  delivery_queue& queue() noexcept { return *queue_; }
  foreground_pump& pump() noexcept { return pump_; }
  dispatcher& tasks() noexcept { return dispatcher_; }
  status_board& status() noexcept { return status_; }

private:
  options opts_;
  std::shared_ptr<delivery_queue> queue_;
  foreground_pump pump_;
  dispatcher dispatcher_;
  status_board status_;
};

} // namespace clicky
