#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace clicky {

// pending -> running -> {completed | failed | cancelled}
enum class task_status { pending, running, completed, failed, cancelled };

inline const char* to_string(task_status s) noexcept {
  switch (s) {
    case task_status::pending:   return "pending";
    case task_status::running:   return "running";
    case task_status::completed: return "completed";
    case task_status::failed:    return "failed";
    case task_status::cancelled: return "cancelled";
  }
  return "unknown";
}

inline bool is_terminal(task_status s) noexcept {
  return s == task_status::completed || s == task_status::failed || s == task_status::cancelled;
}

template <class T>
struct task_record {
  std::uint64_t id{0};
  task_status status{task_status::pending};
  std::optional<T> result{};          // completed only
  std::optional<std::string> error{}; // failed only
  std::chrono::duration<double> elapsed{0.0};

  bool terminal() const noexcept { return is_terminal(status); }
};

} // namespace clicky
