#pragma once

/**
 * @file Log.h
 * @brief Library logger
 *
 * All modules log through one named spdlog logger ("facegate") writing to
 * stderr. The initial level is taken from FACEGATE_LOG_LEVEL when set
 * (trace, debug, info, warn, err, critical, off), otherwise info.
 */

#include <spdlog/spdlog.h>

#include <memory>

namespace FaceGate::Log {

/// Name of the shared logger in the spdlog registry
constexpr const char* LOGGER_NAME = "facegate";

/**
 * @brief Get the library logger (created on first use)
 */
std::shared_ptr<spdlog::logger> Get();

/**
 * @brief Change the library log level
 */
void SetLevel(spdlog::level::level_enum level);

} // namespace FaceGate::Log
