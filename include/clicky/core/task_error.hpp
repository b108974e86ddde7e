#pragma once
#include <exception>
#include <string>
#include <utility>

namespace clicky {

// What a failed unit of work turns into once it leaves its background thread.
struct task_error {
  std::string message;
  std::exception_ptr cause;

  // Rethrows the original exception, for callers that want to match on its type
  [[noreturn]] void rethrow() const { std::rethrow_exception(cause); }
};

// Must be called from inside a catch block.
inline task_error capture_current_error() {
  auto ep = std::current_exception();
  try {
    std::rethrow_exception(ep);
  } catch (const std::exception& e) {
    return task_error{e.what(), ep};
  } catch (...) {
    return task_error{"unknown error", ep};
  }
}

} // namespace clicky
