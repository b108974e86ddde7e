#include <cassert>
#include <chrono>
#include <iostream>
#include <latch>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <clicky/clicky.hpp>

using namespace clicky;
using namespace std::chrono_literals;

int main() {
  log::get()->set_level(spdlog::level::off);

  auto q = std::make_shared<delivery_queue>();
  auto direct = std::make_shared<inline_executor>();
  foreground_pump pump{q};
  single_flight<int> queries{q, direct};

  std::latch in_final{1};
  std::latch release{1};
  task_status seen_from_worker = task_status::pending;
  std::optional<task_record<int>> done;

  // Progress runs on the worker; the final update is slow and reads the executor
  assert(queries.execute_async([]{ return 7; },
    [&](const task_record<int>& r){ done = r; },
    [&](const std::string& s){
      if (s.rfind("Query completed", 0) != 0) return;
      seen_from_worker = queries.current().status;
      in_final.count_down();
      release.wait();
    }));

  in_final.wait();
  assert(seen_from_worker == task_status::completed && "Outcome is recorded before the final update");
  assert(queries.is_running() && "Still running while its worker is delivering");

  const auto t0 = std::chrono::steady_clock::now();
  const bool again = queries.execute_async([]{ return 8; }, [](const task_record<int>&){});
  const auto waited = std::chrono::steady_clock::now() - t0;
  assert(!again && "Rejected while the worker is alive");
  assert(waited < 100ms && "Rejection never waits on the worker");
  assert(!queries.cancel_current() && "Nothing to cancel once the outcome is decided");
  assert(queries.current().status == task_status::completed);

  release.count_down();

  for (int i = 0; i < 1000 && !done; ++i) {
    pump.tick();
    std::this_thread::sleep_for(1ms);
  }
  assert(done && done->status == task_status::completed && *done->result == 7);
  for (int i = 0; i < 1000 && queries.is_running(); ++i) std::this_thread::sleep_for(1ms);
  assert(!queries.is_running());

  std::optional<task_record<int>> next;
  assert(queries.execute_async([]{ return 9; }, [&](const task_record<int>& r){ next = r; }));
  for (int i = 0; i < 1000 && !next; ++i) {
    pump.tick();
    std::this_thread::sleep_for(1ms);
  }
  assert(next && *next->result == 9);

  std::cout << "[single_flight_direct_progress_tests] OK\n";
  return 0;
}
