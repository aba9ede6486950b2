#pragma once

#include <spdlog/logger.h>

#include <memory>

namespace pickler {

// Library-wide logger named "pickler". Created on first use with its level
// taken from PICKLER_LOG_LEVEL (default warn); an application that registers
// its own "pickler" logger with spdlog first gets that one instead.
std::shared_ptr<spdlog::logger> logger();

} // namespace pickler
