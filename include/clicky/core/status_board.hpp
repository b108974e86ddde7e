#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <optional>
#include <string>
#include <utility>

#include <clicky/core/scheduler.hpp>
#include <clicky/core/subscription.hpp>

namespace clicky {

enum class status_level { info, success, error };

struct status_message {
  std::string text;
  status_level level{status_level::info};
};

// Higher value is notified first; equal values keep subscription order
struct priority {
  int value{0};
};

// Status line shared by the panels of one application. Owned by the
// application root and passed down by reference; foreground thread only.
// The board must outlive the subscriptions it hands out.
class status_board {
public:
  using listener_fn = std::function<void(const status_message&)>;

  status_board() = default;
  status_board(const status_board&) = delete;
  status_board& operator=(const status_board&) = delete;

  subscription subscribe(executor& exec, listener_fn fn) {
    return subscribe(exec, priority{}, std::move(fn));
  }

  subscription subscribe(executor& exec, priority prio, listener_fn fn) {
    Node node{};
    node.id = next_id_++;
    node.prio = prio.value;
    node.exec = &exec;
    node.fn = std::move(fn);
    node.enabled = true;

    // Insert by (priority desc, id asc)
    auto it = nodes_.begin();
    for (; it != nodes_.end(); ++it) {
      if (node.prio > it->prio) break;
    }
    it = nodes_.insert(it, std::move(node));
    const std::uint64_t my_id = it->id;

    return subscription([this, my_id] {
      for (auto& n : nodes_) {
        if (n.id == my_id) {
          n.enabled = false;
          break;
        }
      }
    });
  }

  void publish(status_message msg) {
    for (const auto& n : nodes_) {
      if (!n.enabled || !n.fn) continue;
      auto fn = n.fn;
      n.exec->post([fn, msg] { fn(msg); });
    }

    for (auto it = nodes_.begin(); it != nodes_.end();) {
      if (!it->enabled)
        it = nodes_.erase(it);
      else
        ++it;
    }
    last_ = std::move(msg);
  }

  void info(std::string text) { publish({std::move(text), status_level::info}); }
  void success(std::string text) { publish({std::move(text), status_level::success}); }
  void error(std::string text) { publish({std::move(text), status_level::error}); }

  const std::optional<status_message>& last() const noexcept { return last_; }

  std::size_t listeners() const noexcept {
    std::size_t n = 0;
    for (const auto& node : nodes_) n += node.enabled ? 1 : 0;
    return n;
  }

private:
  struct Node {
    std::uint64_t id{};
    int prio{};
    executor* exec{};
    listener_fn fn;
    bool enabled{false};
  };

  std::list<Node> nodes_{};
  std::uint64_t next_id_{1};
  std::optional<status_message> last_{};
};

} // namespace clicky
