#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace rangefs {

// Process-wide "rangefs" logger (stderr).
// Created on first use at info level.
spdlog::logger& log();

// Set level from a config string: trace|debug|info|warn|error|off
Status set_log_level(const std::string& level);

}  // namespace rangefs
