#pragma once
#include <map>
#include <string>
#include <vector>

namespace config {

/**
 * INI-style configuration: "[section]" headers, "key = value" lines, '#' or ';' comments.
 *
 * Values are kept as text and converted by the typed getters; a missing key or a value that
 * does not convert yields the supplied default. "${NAME}" inside a value is replaced by the
 * environment variable NAME (empty when unset), so secrets stay out of the file.
 */
class ProcessConfigManager {
public:
    ProcessConfigManager() = default;

    // Throws std::runtime_error if the file cannot be read or a key appears outside a section
    void load_config(const std::string& config_file);
    void load_config_from_string(const std::string& config_content);

    std::string get_string(const std::string& section, const std::string& key, const std::string& default_value = "") const;
    int get_int(const std::string& section, const std::string& key, int default_value = 0) const;
    double get_double(const std::string& section, const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false) const;
    // Comma-separated list, entries trimmed, empty entries dropped
    std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                      const std::vector<std::string>& default_value = {}) const;

    std::vector<std::string> get_sections() const;
    // Sections named "<prefix><suffix>", returned as suffixes ("connection." -> ids)
    std::vector<std::string> get_sections_with_prefix(const std::string& prefix) const;
    std::vector<std::string> get_keys(const std::string& section) const;
    bool has_section(const std::string& section) const;
    bool has_key(const std::string& section, const std::string& key) const;

    void set_string(const std::string& section, const std::string& key, const std::string& value);

private:
    const std::string* find(const std::string& section, const std::string& key) const;

    std::map<std::string, std::map<std::string, std::string>> config_data_;
};

std::string trim(const std::string& str);
// Replaces every ${NAME} with the environment variable's value
std::string expand_env(const std::string& value);

} // namespace config
