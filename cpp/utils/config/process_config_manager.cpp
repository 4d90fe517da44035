#include "process_config_manager.hpp"
#include "../logging/log_helper.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace config {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string expand_env(const std::string& value) {
    std::string result;
    size_t pos = 0;
    while (pos < value.size()) {
        size_t open = value.find("${", pos);
        if (open == std::string::npos) {
            result += value.substr(pos);
            break;
        }
        size_t close = value.find('}', open + 2);
        if (close == std::string::npos) {
            result += value.substr(pos);
            break;
        }
        result += value.substr(pos, open - pos);
        std::string name = value.substr(open + 2, close - open - 2);
        const char* env = std::getenv(name.c_str());
        if (env) {
            result += env;
        } else {
            LOG_WARN_COMP("CONFIG", "Environment variable " + name + " is not set");
        }
        pos = close + 1;
    }
    return result;
}

void ProcessConfigManager::load_config(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + config_file);
    }
    std::ostringstream content;
    content << file.rdbuf();
    load_config_from_string(content.str());
    LOG_INFO_COMP("CONFIG", "Loaded " + config_file + " (" + std::to_string(config_data_.size()) + " sections)");
}

void ProcessConfigManager::load_config_from_string(const std::string& config_content) {
    std::map<std::string, std::map<std::string, std::string>> parsed;
    std::istringstream stream(config_content);
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line.size() >= 3 && line.front() == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.size() - 2));
            parsed[current_section];
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            LOG_WARN_COMP("CONFIG", "Ignoring line " + std::to_string(line_number) + ": " + line);
            continue;
        }
        if (current_section.empty()) {
            throw std::runtime_error("Key outside of section at line " + std::to_string(line_number));
        }
        parsed[current_section][trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
    }

    config_data_ = std::move(parsed);
}

const std::string* ProcessConfigManager::find(const std::string& section, const std::string& key) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return nullptr;
    }
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return nullptr;
    }
    return &key_it->second;
}

std::string ProcessConfigManager::get_string(const std::string& section, const std::string& key,
                                             const std::string& default_value) const {
    const std::string* value = find(section, key);
    return value ? expand_env(*value) : default_value;
}

int ProcessConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    const std::string* value = find(section, key);
    if (!value) return default_value;
    try {
        return std::stoi(expand_env(*value));
    } catch (const std::exception&) {
        LOG_WARN_COMP("CONFIG", "[" + section + "] " + key + " is not an integer, using default");
        return default_value;
    }
}

double ProcessConfigManager::get_double(const std::string& section, const std::string& key, double default_value) const {
    const std::string* value = find(section, key);
    if (!value) return default_value;
    try {
        return std::stod(expand_env(*value));
    } catch (const std::exception&) {
        LOG_WARN_COMP("CONFIG", "[" + section + "] " + key + " is not a number, using default");
        return default_value;
    }
}

bool ProcessConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    const std::string* value = find(section, key);
    if (!value) return default_value;
    std::string lower = expand_env(*value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return default_value;
}

std::vector<std::string> ProcessConfigManager::get_list(const std::string& section, const std::string& key,
                                                        const std::vector<std::string>& default_value) const {
    const std::string* value = find(section, key);
    if (!value) return default_value;

    std::vector<std::string> result;
    std::stringstream ss(expand_env(*value));
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }
    return result;
}

std::vector<std::string> ProcessConfigManager::get_sections() const {
    std::vector<std::string> sections;
    for (const auto& [section, _] : config_data_) {
        sections.push_back(section);
    }
    return sections;
}

std::vector<std::string> ProcessConfigManager::get_sections_with_prefix(const std::string& prefix) const {
    std::vector<std::string> suffixes;
    for (const auto& [section, _] : config_data_) {
        if (section.size() > prefix.size() && section.compare(0, prefix.size(), prefix) == 0) {
            suffixes.push_back(section.substr(prefix.size()));
        }
    }
    return suffixes;
}

std::vector<std::string> ProcessConfigManager::get_keys(const std::string& section) const {
    std::vector<std::string> keys;
    auto section_it = config_data_.find(section);
    if (section_it != config_data_.end()) {
        for (const auto& [key, _] : section_it->second) {
            keys.push_back(key);
        }
    }
    return keys;
}

bool ProcessConfigManager::has_section(const std::string& section) const {
    return config_data_.find(section) != config_data_.end();
}

bool ProcessConfigManager::has_key(const std::string& section, const std::string& key) const {
    return find(section, key) != nullptr;
}

void ProcessConfigManager::set_string(const std::string& section, const std::string& key, const std::string& value) {
    config_data_[section][key] = value;
}

} // namespace config
