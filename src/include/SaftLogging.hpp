#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace saft {

// Name of the spdlog logger the engine writes to. A host may register its own logger
// under this name before the first ingestion run.
constexpr const char *LOGGER_NAME = "saft";

// Shared engine logger. Created on first use (stderr, level warn, or SAFT_LOG_LEVEL)
// unless a logger named LOGGER_NAME is already registered.
std::shared_ptr<spdlog::logger> Logger();

void SetLogLevel(const std::string &level);

} // namespace saft
