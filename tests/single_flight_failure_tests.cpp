#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <clicky/clicky.hpp>

using namespace clicky;
using namespace std::chrono_literals;

struct rows {
  std::vector<std::string> columns;
  std::size_t count{0};
};

// Work that cannot be copied onto its worker thread
struct uncopyable_query {
  uncopyable_query() = default;
  uncopyable_query(const uncopyable_query&) { throw std::runtime_error("copy"); }
  uncopyable_query(uncopyable_query&&) { throw std::runtime_error("move"); }
  rows operator()() { return {}; }
};

int main() {
  log::get()->set_level(spdlog::level::off);

  auto q = std::make_shared<delivery_queue>();
  foreground_pump pump{q};
  single_flight<rows> queries{q};

  // Failure: error text and elapsed captured, progress ends with the failure text
  {
    std::optional<task_record<rows>> done;
    std::vector<std::string> progress;
    int completions = 0;

    assert(queries.execute_async([]() -> rows { throw std::runtime_error("Code: 60. Table default.nope does not exist"); },
                                 [&](const task_record<rows>& r){ done = r; ++completions; },
                                 [&](const std::string& s){
                                   // progress always precedes completion on the queue
                                   assert(!done);
                                   progress.push_back(s);
                                 }));

    for (int i = 0; i < 1000 && !done; ++i) {
      pump.tick();
      std::this_thread::sleep_for(1ms);
    }
    pump.tick();
    assert(done && completions == 1);
    assert(done->status == task_status::failed);
    assert(done->error && done->error->find("does not exist") != std::string::npos);
    assert(!done->result);
    assert(done->elapsed.count() >= 0.0);
    assert(progress.size() == 2);
    assert(progress[0] == "Executing query...");
    assert(progress[1] == "Query failed: Code: 60. Table default.nope does not exist");
    assert(std::string(to_string(done->status)) == "failed");
    for (int i = 0; i < 1000 && queries.is_running(); ++i) std::this_thread::sleep_for(1ms);
    assert(!queries.is_running());
  }

  // Success: result carried in the record
  {
    std::optional<task_record<rows>> done;
    std::vector<std::string> progress;
    assert(queries.execute_async([]{ return rows{{"id", "name"}, 3}; },
                                 [&](const task_record<rows>& r){ done = r; },
                                 [&](const std::string& s){ progress.push_back(s); }));
    for (int i = 0; i < 1000 && !done; ++i) {
      pump.tick();
      std::this_thread::sleep_for(1ms);
    }
    assert(done && done->status == task_status::completed);
    assert(done->result->count == 3 && done->result->columns.size() == 2);
    assert(!done->error);
    assert(progress.size() == 2);
    assert(progress[1].rfind("Query completed in ", 0) == 0);
    assert(progress[1].back() == 's');
  }

  // The worker never starts: reported as failed, and the slot is free again
  {
    for (int i = 0; i < 1000 && queries.is_running(); ++i) std::this_thread::sleep_for(1ms);
    std::optional<task_record<rows>> done;
    uncopyable_query w;
    assert(queries.execute_async(w, [&](const task_record<rows>& r){ done = r; }));
    assert(!queries.is_running());
    assert(pump.tick() == 1);
    assert(done && done->status == task_status::failed && *done->error == "copy");
  }

  std::cout << "[single_flight_failure_tests] OK\n";
  return 0;
}
