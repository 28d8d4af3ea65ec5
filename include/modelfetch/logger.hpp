#pragma once

#include <cstdio>
#include <memory>
#include <string>
#include <utility>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace modelfetch {

inline constexpr const char kCoreLogger[] = "core_logger";

class Logger {
public:
    // Registers the console logger; repeated calls only update the level.
    static void setup(spdlog::level::level_enum level = spdlog::level::info);
    // nullptr when setup() has not run.
    static std::shared_ptr<spdlog::logger> getLogger(const std::string& name = kCoreLogger);
};

namespace detail {

template <typename... Args>
void log(spdlog::level::level_enum level, const char* pattern, Args&&... args) {
    auto message = fmt::format(fmt::runtime(pattern), std::forward<Args>(args)...);
    if (auto logger = Logger::getLogger()) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

} // namespace detail

} // namespace modelfetch
