#include <clicky/clicky.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace clicky;
using namespace std::chrono_literals;

// Stand-in for the database driver: blocks, sometimes fails
static std::string fake_connect(const std::string& host, int port, std::chrono::seconds timeout) {
  std::this_thread::sleep_for(200ms);
  if (port != 9000) throw std::runtime_error("Connection refused (" + host + ":" + std::to_string(port) + ")");
  return "Connected to " + host + ":" + std::to_string(port) + " (timeout " + std::to_string(timeout.count()) + "s)";
}

int main() {
  runtime rt{options::from_env()};

  inline_executor ui;
  auto status_sub = rt.status().subscribe(ui, [](const status_message& m){
    const char* tag = m.level == status_level::error ? "[ERR] " : m.level == status_level::success ? "[OK]  " : "[..]  ";
    std::cout << tag << m.text << "\n";
  });

  // Two "clicks" in a row, one with a bad port; plus a table list fetch
  for (int port : {9000, 9001}) {
    rt.status().info("Connecting to localhost:" + std::to_string(port) + "...");
    rt.tasks().submit(
      [port, timeout = rt.config().connect_timeout]{ return fake_connect("localhost", port, timeout); },
      [&](std::string msg){ rt.status().success(msg); },
      [&](const task_error& e){ rt.status().error("Connection failed:\n" + e.message); });
  }
  rt.tasks().submit(
    []{ std::this_thread::sleep_for(100ms); return std::vector<std::string>{"events", "sessions", "users"}; },
    [&](std::vector<std::string> tables){
      rt.status().info("Loaded " + std::to_string(tables.size()) + " tables");
    });

  // Render loop: never blocks, drains once per frame
  int frames = 0;
  while (rt.tasks().is_busy() || !rt.queue().empty()) {
    rt.tick();
    ++frames;
    std::this_thread::sleep_for(rt.config().pump_interval);
  }
  std::cout << "frames rendered while waiting: " << frames << "\n";
  return 0;
}
