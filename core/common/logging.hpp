#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace eap {

/// Shared "eap" logger. Created on first use, writes to stdout.
std::shared_ptr<spdlog::logger> logger();

/// Adjust verbosity of the shared logger.
void setLogLevel(spdlog::level::level_enum level);

} // namespace eap
