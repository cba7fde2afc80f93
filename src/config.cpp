#include "config.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

void Config::split_assignment(const std::string& text, std::string& key, std::string& value) {
    size_t pos = text.find('=');
    if (pos == std::string::npos) {
        throw ConfigError("Expected key=value, actual got '" + text + "'");
    }
    key = trim(text.substr(0, pos));
    value = trim(text.substr(pos + 1));
    if (key.empty()) {
        throw ConfigError("Missing key in '" + text + "'");
    }
}

Config Config::from_args(const std::vector<std::string>& args) {
    Config config;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (const auto& arg : args) {
        std::string key;
        std::string value;
        split_assignment(arg, key, value);
        if (key == "config") {
            config.load_file(value);
        } else {
            overrides.emplace_back(key, value);
        }
    }

    for (const auto& [key, value] : overrides) {
        config.set(key, value);
    }
    return config;
}

void Config::load_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + filename);
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }
        std::string key;
        std::string value;
        split_assignment(content, key, value);
        set(key, value);
    }
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

bool Config::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto it = values_.find(key);
    return it == values_.end() ? default_value : it->second;
}

double Config::get_double(const std::string& key, double default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    const std::string& text = it->second;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || errno != 0 || end != text.c_str() + text.size()) {
        throw ConfigError("The param '" + key + "' must be a number, actual got '" + text + "'");
    }
    return value;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    const std::string& text = it->second;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || errno != 0 || end != text.c_str() + text.size() ||
        value < INT_MIN || value > INT_MAX) {
        throw ConfigError("The param '" + key + "' must be an integer, actual got '" + text + "'");
    }
    return static_cast<int>(value);
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    std::string text = it->second;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "true" || text == "1" || text == "yes") {
        return true;
    }
    if (text == "false" || text == "0" || text == "no") {
        return false;
    }
    throw ConfigError("The param '" + key + "' must be a boolean, actual got '" + it->second + "'");
}
