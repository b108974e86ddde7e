#include <clicky/clicky.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace clicky;
using namespace std::chrono_literals;

struct result_set {
  std::size_t rows{0};
};

int main() {
  runtime rt{options::from_env()};
  auto queries = rt.make_single_flight<result_set>();

  int reported = 0;
  auto report = [&reported](const task_record<result_set>& r){
    ++reported;
    std::cout << "[query " << r.id << "] " << to_string(r.status);
    if (r.result) std::cout << ", " << r.result->rows << " rows";
    if (r.error) std::cout << ", error: " << *r.error;
    std::cout << " (" << r.elapsed.count() << "s)\n";
  };
  auto progress = [](const std::string& s){ std::cout << "  " << s << "\n"; };

  // A slow scan that checks the token between chunks
  auto slow_scan = [](const cancel_token& tok){
    result_set rs;
    for (int chunk = 0; chunk < 50 && !tok.cancelled(); ++chunk) {
      std::this_thread::sleep_for(20ms);
      rs.rows += 1000;
    }
    return rs;
  };

  queries->execute_async(slow_scan, report, progress);

  // Impatient user: re-click "Run", then "Cancel"
  if (!queries->execute_async(slow_scan, report, progress))
    std::cout << "  another query is still running, click ignored\n";

  for (int frame = 0; reported < 1; ++frame) {
    if (frame == 10) queries->cancel_current();
    rt.tick();
    std::this_thread::sleep_for(rt.config().pump_interval);
  }

  // Then a quick one that completes, once the cancelled worker has exited
  while (queries->is_running()) std::this_thread::sleep_for(1ms);
  queries->execute_async([]{ return result_set{100}; }, report, progress);
  while (reported < 2) {
    rt.tick();
    std::this_thread::sleep_for(rt.config().pump_interval);
  }
  return 0;
}
