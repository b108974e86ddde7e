#pragma once
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

#include <clicky/core/log.hpp>

namespace clicky {

// RAII handle over a "stop listening" action (status board listener, host timer).
// - Move-only: one owner, one cancel.
// - The destructor cancels unless told otherwise.
class subscription {
public:
  using cancel_fn = std::function<void()>;

  subscription() noexcept = default;

  explicit subscription(cancel_fn fn, bool cancel_on_dtor = true) noexcept
    : cancel_(std::move(fn)), cancel_on_dtor_(cancel_on_dtor) {}

  subscription(const subscription&) = delete;
  subscription& operator=(const subscription&) = delete;

  subscription(subscription&& other) noexcept
    : cancel_(std::move(other.cancel_))
    , cancel_on_dtor_(other.cancel_on_dtor_) {
    other.cancel_ = nullptr;
    other.cancel_on_dtor_ = false;
  }

  subscription& operator=(subscription&& other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::move(other.cancel_);
      cancel_on_dtor_ = other.cancel_on_dtor_;
      other.cancel_ = nullptr;
      other.cancel_on_dtor_ = false;
    }
    return *this;
  }

  ~subscription() {
    if (cancel_on_dtor_) reset();
  }

  // Runs the cancel action once. Repeated calls are no-op.
  void reset() noexcept {
    if (cancel_) {
      auto fn = std::move(cancel_);
      cancel_ = nullptr;
      try {
        fn();
      } catch (const std::exception& e) {
        log::get()->error("subscription cancel threw: {}", e.what());
      } catch (...) {
        log::get()->error("subscription cancel threw a non-standard exception");
      }
    }
    cancel_on_dtor_ = false;
  }

  // Forget the cancel action; whoever holds the other end stays attached.
  void release() noexcept {
    cancel_ = nullptr;
    cancel_on_dtor_ = false;
  }

  explicit operator bool() const noexcept { return static_cast<bool>(cancel_); }

private:
  cancel_fn cancel_{};
  bool cancel_on_dtor_{true};
};

template <class F,
          std::enable_if_t<std::is_invocable_v<F&>, int> = 0>
inline subscription make_subscription(F&& f, bool cancel_on_dtor = true) {
  return subscription(subscription::cancel_fn(std::forward<F>(f)), cancel_on_dtor);
}

} // namespace clicky
