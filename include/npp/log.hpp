// include/npp/log.hpp
#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace npp {

// Library-wide logger ("npp", coloured stderr). Created on first use and
// safe to share between threads. Defaults to warn.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

} // namespace npp
