#pragma once

#include <map>
#include <string>

namespace modelfetch {

// Minimal INI reader/writer: [section], key = value, ';' or '#' comments.
class IniConfig {
public:
    bool load(const std::string& filename);
    bool save(const std::string& filename) const;

    [[nodiscard]] std::string getValue(const std::string& section, const std::string& key,
                                       const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    [[nodiscard]] bool hasValue(const std::string& section, const std::string& key) const;
    [[nodiscard]] std::map<std::string, std::string> section(const std::string& name) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data_;
};

} // namespace modelfetch
