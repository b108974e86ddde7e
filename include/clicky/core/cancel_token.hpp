#pragma once
#include <atomic>
#include <memory>
#include <utility>

namespace clicky {

// Read-only view of a cancellation flag. Work may poll it to stop early;
// nothing forces it to.
class cancel_token {
public:
  cancel_token() = default;
  explicit cancel_token(std::shared_ptr<const std::atomic<bool>> flag) noexcept
    : flag_(std::move(flag)) {}

  bool cancelled() const noexcept {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

  explicit operator bool() const noexcept { return cancelled(); }

private:
  std::shared_ptr<const std::atomic<bool>> flag_{};
};

} // namespace clicky
