#pragma once
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace clicky {

struct config_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Runtime knobs. Defaults mirror the desktop client's constants.
struct options {
  std::string log_level{"info"};

  // How often a timer-driven host calls the pump (~60 fps)
  std::chrono::milliseconds pump_interval{16};

  // Handed to the database driver by callers; the core never times out work itself
  std::chrono::seconds connect_timeout{5};
  std::chrono::seconds send_receive_timeout{30};
  int query_retries{2};

  int default_limit{100};
  int max_rows_limit{1000};

  // Defaults overridden by CLICKY_* environment variables
  static options from_env() {
    options o;
    if (const char* v = std::getenv("CLICKY_LOG_LEVEL"); v && *v) o.log_level = v;
    if (auto ms = read_int("CLICKY_PUMP_INTERVAL_MS")) o.pump_interval = std::chrono::milliseconds(*ms);
    if (auto s = read_int("CLICKY_CONNECT_TIMEOUT")) o.connect_timeout = std::chrono::seconds(*s);
    if (auto s = read_int("CLICKY_SEND_RECEIVE_TIMEOUT")) o.send_receive_timeout = std::chrono::seconds(*s);
    if (auto n = read_int("CLICKY_QUERY_RETRIES")) o.query_retries = static_cast<int>(*n);
    return o;
  }

private:
  static std::optional<long> read_int(const char* name) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return std::nullopt;
    char* end = nullptr;
    const long v = std::strtol(raw, &end, 10);
    if (end == raw || *end != '\0' || v < 0) {
      throw config_error(std::string(name) + ": expected a non-negative integer, got '" + raw + "'");
    }
    return v;
  }
};

} // namespace clicky
