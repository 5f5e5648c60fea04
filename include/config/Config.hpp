#pragma once
#include <chrono>

#include "spdlog/common.h"

namespace tlcp::config {

using ms = std::chrono::milliseconds;

// log level used when the CLI gets no level argument
constexpr spdlog::level::level_enum DEFAULT_LOG_LEVEL = spdlog::level::info;

// how long the CLI waits on stdin before re-checking the shutdown signal
constexpr ms DEFAULT_STDIN_POLL_INTERVAL_MS = ms(200);

} // namespace tlcp::config
