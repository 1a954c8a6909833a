/**
 * @file logging.hpp
 * @brief Access to the library's spdlog logger.
 */
#pragma once
#include "gmlio/common/common.hpp"

#include <spdlog/spdlog.h>

namespace gmlio
{

/**
 * @brief Name under which the library logger is registered with spdlog.
 */
inline constexpr const char* k_logger_name = "gmlio";

/**
 * @brief Get the library logger.
 *
 * @details
 * Created on first use as a colored stderr logger at level `warn`. If a
 * logger named `gmlio` is already registered (e.g. installed by the host
 * application), that one is returned instead. Falls back to spdlog's default
 * logger if the registration fails.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 *        "critical", "off") and apply it to the library logger.
 * @throw std::invalid_argument if the name is not a known level.
 */
void set_log_level(const std::string& level_name);

} // namespace gmlio
