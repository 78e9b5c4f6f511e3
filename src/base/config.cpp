/**
 * @file config.cpp
 * @brief Config 类实现
 */

#include "base/config.hpp"
#include <stdexcept>
#include "base/logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

namespace paneltalk {

Config& Config::instance() {
    static Config inst;
    return inst;
}

std::string Config::trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, (last - first + 1));
}

void Config::parse_line(const std::string& raw, std::string& current_section) {
    std::string line = trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return;
    }

    if (line[0] == '[' && line.back() == ']') {
        current_section = trim(line.substr(1, line.length() - 2));
        return;
    }

    size_t delimiter_pos = line.find('=');
    if (delimiter_pos == std::string::npos) {
        return;
    }
    std::string key = trim(line.substr(0, delimiter_pos));
    std::string value = trim(line.substr(delimiter_pos + 1));
    if (!key.empty()) {
        data_[current_section][key] = value;
    }
}

bool Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG() << "[Config] Could not open config file " << filename;
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();

    std::string line;
    std::string current_section;
    while (std::getline(file, line)) {
        parse_line(line, current_section);
    }
    return true;
}

void Config::load_from_string(const std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();

    std::istringstream in(content);
    std::string line;
    std::string current_section;
    while (std::getline(in, line)) {
        parse_line(line, current_section);
    }
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

std::string Config::get(const std::string& section, const std::string& key, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sec_it = data_.find(section);
    if (sec_it != data_.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}

int Config::get_int(const std::string& section, const std::string& key, int default_value) {
    std::string val_str = get(section, key, "");
    if (val_str.empty()) {
        return default_value;
    }
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(val_str, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != val_str.size()) {
        throw std::invalid_argument("[" + section + "] " + key + " is not an integer: " + val_str);
    }
    return value;
}

bool Config::get_bool(const std::string& section, const std::string& key, bool default_value) {
    std::string val_str = get(section, key, "");
    std::transform(val_str.begin(), val_str.end(), val_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val_str == "true" || val_str == "yes" || val_str == "on" || val_str == "1") {
        return true;
    }
    if (val_str == "false" || val_str == "no" || val_str == "off" || val_str == "0") {
        return false;
    }
    return default_value;
}

} // namespace paneltalk
