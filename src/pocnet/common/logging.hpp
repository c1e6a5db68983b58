/**
 * @file logging.hpp
 * @brief Access to the engine's spdlog logger.
 */
#pragma once
#include "pocnet/common/common.hpp"
#include <spdlog/spdlog.h>

namespace pocnet
{

/**
 * @brief Get the shared `pocnet` logger.
 *
 * @details
 * The logger is created on first use with a colored stderr sink and registered
 * with spdlog under the name "pocnet". If a logger with that name has already
 * been registered by the host application, that logger is used instead.
 *
 * @par Thread safety
 * - Safe to call from any thread.
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Set the level of the `pocnet` logger.
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace pocnet
