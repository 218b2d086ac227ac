#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ttlcache {

std::shared_ptr<spdlog::logger> Logger() {
  static std::shared_ptr<spdlog::logger> logger = [] {
    auto existing = spdlog::get(loggerName);
    if (existing) return existing;
    auto l = spdlog::stderr_color_mt(loggerName);
    l->set_level(spdlog::level::warn);
    return l;
  }();
  return logger;
}

void SetLogLevel(spdlog::level::level_enum level) {
  Logger()->set_level(level);
}

}
