#include "pocnet/common/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pocnet
{

std::shared_ptr<spdlog::logger> get_logger()
{
    static std::shared_ptr<spdlog::logger> s_logger = []
    {
        auto existing = spdlog::get("pocnet");
        if (existing)
        {
            return existing;
        }
        auto logger = spdlog::stderr_color_mt("pocnet");
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);
        return logger;
    }();
    return s_logger;
}

void set_log_level(spdlog::level::level_enum level)
{
    get_logger()->set_level(level);
}

} // namespace pocnet
