#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <latch>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <clicky/clicky.hpp>

using namespace clicky;
using namespace std::chrono_literals;

// Direct progress delivery that parks the worker on its first update
struct gated_executor final : executor {
  std::latch reached{1};
  std::latch release{1};
  bool first = true;

  void post(std::function<void()> f) override {
    if (first) {
      first = false;
      reached.count_down();
      release.wait();
    }
    f();
  }
};

int main() {
  log::get()->set_level(spdlog::level::off);

  auto q = std::make_shared<delivery_queue>();
  auto gate = std::make_shared<gated_executor>();
  foreground_pump pump{q};
  single_flight<int> queries{q, gate};

  std::atomic<int> work_calls{0};
  std::optional<task_record<int>> done;
  std::vector<std::string> progress;

  assert(queries.execute_async([&]{ work_calls.fetch_add(1); return 99; },
                               [&](const task_record<int>& r){ done = r; },
                               [&](const std::string& s){ progress.push_back(s); }));

  // Worker is parked before its pre-start check
  gate->reached.wait();
  assert(queries.is_running());
  assert(queries.cancel_current() && "A live task exists");
  assert(queries.token().cancelled());
  gate->release.count_down();

  for (int i = 0; i < 1000 && !done; ++i) {
    pump.tick();
    std::this_thread::sleep_for(1ms);
  }
  assert(done && "Completion is always reported");
  assert(done->status == task_status::cancelled);
  assert(!done->result && !done->error);
  assert(work_calls.load() == 0 && "Work must never start once cancelled beforehand");
  assert((progress == std::vector<std::string>{"Executing query..."}));
  for (int i = 0; i < 1000 && queries.is_running(); ++i) std::this_thread::sleep_for(1ms);
  assert(!queries.is_running() && "The worker exits shortly after reporting");

  // The next submission starts with a cleared signal
  std::optional<task_record<int>> next;
  assert(queries.execute_async([&]{ work_calls.fetch_add(1); return 5; },
                               [&](const task_record<int>& r){ next = r; }));
  for (int i = 0; i < 1000 && !next; ++i) {
    pump.tick();
    std::this_thread::sleep_for(1ms);
  }
  assert(next && next->status == task_status::completed && *next->result == 5);
  assert(work_calls.load() == 1);

  std::cout << "[single_flight_cancel_before_start_tests] OK\n";
  return 0;
}
