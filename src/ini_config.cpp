#include "modelfetch/ini_config.hpp"
#include "modelfetch/logger.hpp"

#include <fstream>
#include <optional>
#include <utility>

namespace modelfetch {

namespace {

std::string trimCopy(const std::string& input) {
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

bool shouldSkipLine(const std::string& line) {
    return line.empty() || line.front() == ';' || line.front() == '#';
}

bool parseSectionHeader(const std::string& line, std::string& section) {
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        section = trimCopy(line.substr(1, line.size() - 2));
        return true;
    }
    return false;
}

std::optional<std::pair<std::string, std::string>> parseKeyValue(const std::string& line) {
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = trimCopy(line.substr(0, delimiter));
    std::string value = trimCopy(line.substr(delimiter + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}

} // namespace

bool IniConfig::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        detail::log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    std::string raw_line;
    std::string section;
    while (std::getline(file, raw_line)) {
        const std::string line = trimCopy(raw_line);
        if (shouldSkipLine(line) || parseSectionHeader(line, section)) {
            continue;
        }
        if (auto key_value = parseKeyValue(line)) {
            data_[section][key_value->first] = key_value->second;
        } else {
            detail::log(spdlog::level::warn, "Ignoring malformed line in {}: {}", filename, line);
        }
    }
    return true;
}

bool IniConfig::save(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        detail::log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    for (const auto& section : data_) {
        file << "[" << section.first << "]\n";
        for (const auto& pair : section.second) {
            file << pair.first << " = " << pair.second << "\n";
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}

std::string IniConfig::getValue(const std::string& section, const std::string& key,
                                const std::string& default_value) const {
    const auto sec_it = data_.find(section);
    if (sec_it != data_.end()) {
        const auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}

void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value) {
    data_[section][key] = value;
}

bool IniConfig::hasValue(const std::string& section, const std::string& key) const {
    const auto sec_it = data_.find(section);
    return sec_it != data_.end() && sec_it->second.count(key) != 0;
}

std::map<std::string, std::string> IniConfig::section(const std::string& name) const {
    const auto it = data_.find(name);
    if (it == data_.end()) {
        return {};
    }
    return it->second;
}

} // namespace modelfetch
