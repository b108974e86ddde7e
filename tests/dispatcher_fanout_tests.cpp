#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <thread>
#include <clicky/clicky.hpp>

using namespace clicky;
using namespace std::chrono_literals;

int main() {
  log::get()->set_level(spdlog::level::off);

  constexpr int N = 100;
  auto q = std::make_shared<delivery_queue>();
  foreground_pump pump{q};
  dispatcher tasks{q};

  const auto ui_thread = std::this_thread::get_id();
  std::atomic<int> worker_off_ui{0};
  int delivered = 0;
  int off_thread_deliveries = 0;
  std::set<int> seen;

  for (int i = 0; i < N; ++i) {
    tasks.submit([i, ui_thread, &worker_off_ui]{
        if (std::this_thread::get_id() != ui_thread) worker_off_ui.fetch_add(1);
        // uneven finishing order
        std::this_thread::sleep_for(std::chrono::microseconds((N - i) * 50));
        return i;
      },
      [&](int v){
        ++delivered;
        seen.insert(v);
        if (std::this_thread::get_id() != ui_thread) ++off_thread_deliveries;
      });
  }
  assert(tasks.is_busy());

  bool ok = false;
  for (int i = 0; i < 5000; ++i) {
    if (!tasks.is_busy()) { ok = true; break; }
    std::this_thread::sleep_for(1ms);
  }
  assert(ok && "All workers must finish");
  assert(delivered == 0 && "Nothing runs until the foreground drains");
  assert(q->pending() == static_cast<std::size_t>(N));

  // One drain runs all of them, on this thread only
  assert(q->drain_and_run() == static_cast<std::size_t>(N));
  assert(delivered == N);
  assert(seen.size() == static_cast<std::size_t>(N));
  assert(off_thread_deliveries == 0);
  assert(worker_off_ui.load() == N && "Work must run on background threads");
  assert(pump.tick() == 0);

  std::cout << "[dispatcher_fanout_tests] OK\n";
  return 0;
}
