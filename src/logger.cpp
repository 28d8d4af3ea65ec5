#include "modelfetch/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace modelfetch {

void Logger::setup(spdlog::level::level_enum level) {
    auto logger = spdlog::get(kCoreLogger);
    if (!logger) {
        logger = spdlog::stderr_color_mt(kCoreLogger);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    }
    logger->set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::getLogger(const std::string& name) {
    return spdlog::get(name);
}

} // namespace modelfetch
