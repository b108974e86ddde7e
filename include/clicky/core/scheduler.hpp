#pragma once
#include <functional>

namespace clicky {

// Basic executor interface: where a continuation gets to run
struct executor {
  virtual ~executor() = default;
  virtual void post(std::function<void()> f) = 0;
};

// Synchronous: runs immediately on the posting thread (direct delivery, tests)
struct inline_executor final : executor {
  void post(std::function<void()> f) override { f(); }
};

} // namespace clicky
