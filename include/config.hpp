#pragma once

#include <string>
#include <unordered_map>
#include <vector>

// Flat key/value job configuration with typed lookups
class Config {
public:
    Config() = default;

    // Parse "key=value" arguments; "config=<file>" loads a properties file first
    // and the remaining arguments override it
    static Config from_args(const std::vector<std::string>& args);

    // Properties file: key=value per line, '#' comments, blank lines ignored
    void load_file(const std::string& filename);

    void set(const std::string& key, const std::string& value);
    bool contains(const std::string& key) const;

    std::string get_string(const std::string& key, const std::string& default_value) const;
    double get_double(const std::string& key, double default_value) const;
    int get_int(const std::string& key, int default_value) const;
    bool get_bool(const std::string& key, bool default_value) const;

private:
    std::unordered_map<std::string, std::string> values_;

    static void split_assignment(const std::string& text, std::string& key, std::string& value);
};

std::string trim(const std::string& text);
