/**
 * @file logging.cpp
 */
#include "gmlio/common/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gmlio
{

namespace
{

std::shared_ptr<spdlog::logger> create_logger()
{
    if (auto existing = spdlog::get(k_logger_name))
    {
        return existing;
    }

    try
    {
        auto created = spdlog::stderr_color_mt(k_logger_name);
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        return created;
    }
    catch (const spdlog::spdlog_ex&)
    {
        return spdlog::default_logger();
    }
}

} // namespace

std::shared_ptr<spdlog::logger> logger()
{
    // Function-local static: initialized exactly once, even under concurrent first calls.
    static const std::shared_ptr<spdlog::logger> s_logger = create_logger();
    return s_logger;
}

void set_log_level(const std::string& level_name)
{
    // from_str maps unknown names to "off", so "off" has to be checked by name.
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off")
    {
        throw std::invalid_argument("Unknown log level: " + level_name);
    }
    logger()->set_level(level);
}

} // namespace gmlio
