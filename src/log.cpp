// src/log.cpp
#include "npp/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace npp {

std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("npp");
    if (existing)
      return existing;
    auto lg = spdlog::stderr_color_mt("npp");
    lg->set_level(spdlog::level::warn);
    lg->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return lg;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

} // namespace npp
