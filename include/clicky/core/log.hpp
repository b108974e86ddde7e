#pragma once
#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <clicky/core/config.hpp>

namespace clicky {
namespace log {

inline constexpr const char* logger_name = "clicky";

// Library logger. Created on first use; reuses one registered by the host under the same name.
inline std::shared_ptr<spdlog::logger> get() {
  static std::shared_ptr<spdlog::logger> lg = [] {
    if (auto existing = spdlog::get(logger_name)) return existing;
    return spdlog::stderr_color_mt(logger_name);
  }();
  return lg;
}

inline void configure(const options& opts) {
  const auto lvl = spdlog::level::from_str(opts.log_level);
  // from_str maps unknown names to "off"; only accept that when asked for explicitly
  if (lvl == spdlog::level::off && opts.log_level != "off") {
    throw config_error("unknown log level '" + opts.log_level + "'");
  }
  get()->set_level(lvl);
}

} // namespace log
} // namespace clicky
