#include "modelfetch/settings.hpp"
#include "modelfetch/logger.hpp"

#include <exception>
#include <limits>
#include <stdexcept>
#include <sstream>

namespace modelfetch {

namespace {

template <typename T>
void readNumber(const IniConfig& config, const char* section, const char* key, T& target, T minimum,
                T maximum = std::numeric_limits<T>::max()) {
    if (!config.hasValue(section, key)) {
        return;
    }
    const std::string raw = config.getValue(section, key);
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(raw, &consumed);
        if (consumed != raw.size() || value < static_cast<long long>(minimum) ||
            static_cast<unsigned long long>(value) > static_cast<unsigned long long>(maximum)) {
            throw std::invalid_argument(raw);
        }
        target = static_cast<T>(value);
    } catch (const std::exception&) {
        detail::log(spdlog::level::warn, "Invalid value for [{}] {}: '{}', keeping {}", section, key, raw, target);
    }
}

} // namespace

std::vector<std::string> splitList(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, separator)) {
        const auto begin = item.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        const auto end = item.find_last_not_of(" \t");
        items.push_back(item.substr(begin, end - begin + 1));
    }
    return items;
}

Settings Settings::fromConfig(const IniConfig& config) {
    Settings settings;

    readNumber<std::size_t>(config, "download", "connections", settings.transfer.connections, 1, kMaxConnections);
    readNumber<std::uint64_t>(config, "download", "chunk_threshold", settings.transfer.chunk_threshold, 0);

    long long interval_ms = settings.transfer.progress_interval.count();
    readNumber<long long>(config, "download", "progress_interval_ms", interval_ms, 0);
    settings.transfer.progress_interval = std::chrono::milliseconds(interval_ms);

    long long pause_ms = settings.pause_poll.count();
    readNumber<long long>(config, "download", "pause_poll_ms", pause_ms, 1);
    settings.pause_poll = std::chrono::milliseconds(pause_ms);

    readNumber<long>(config, "download", "buffer_size", settings.http.buffer_size, 1024);
    readNumber<long>(config, "download", "connect_timeout", settings.http.connect_timeout, 0);
    readNumber<long>(config, "download", "low_speed_time", settings.http.low_speed_time, 0);
    readNumber<long>(config, "download", "low_speed_limit", settings.http.low_speed_limit, 1);
    settings.http.user_agent = config.getValue("download", "user_agent", settings.http.user_agent);

    if (config.hasValue("log", "level")) {
        const std::string level = config.getValue("log", "level");
        const auto parsed = spdlog::level::from_str(level);
        if (parsed == spdlog::level::off && level != "off") {
            detail::log(spdlog::level::warn, "Unknown log level '{}', keeping info", level);
        } else {
            settings.log_level = parsed;
        }
    }

    for (const auto& entry : config.section("paths")) {
        settings.paths[entry.first] = splitList(entry.second);
    }
    for (const auto& entry : config.section("path_aliases")) {
        if (entry.second.empty()) {
            settings.aliases.erase(entry.first);
        } else {
            settings.aliases[entry.first] = entry.second;
        }
    }

    if (config.hasValue("extensions", "supported")) {
        settings.extensions = splitList(config.getValue("extensions", "supported"));
    }
    return settings;
}

void Settings::applyTo(FolderPathRegistry& registry) const {
    for (const auto& entry : paths) {
        registry.setCategory(entry.first, entry.second);
    }
    for (const auto& entry : aliases) {
        registry.setAlias(entry.first, entry.second);
    }
    registry.setSupportedExtensions(extensions);
}

} // namespace modelfetch
