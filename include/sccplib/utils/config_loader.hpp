#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sccplib::utils {

/**
 * @brief Configuration value
 */
using ConfigValue = std::variant<
    std::string,
    int64_t,
    double,
    bool,
    std::vector<std::string>
>;

/**
 * @brief Key/value configuration store
 *
 * Keys are dotted paths ("log.level"). Sources applied later override
 * earlier ones: defaults, JSON file, environment, command line.
 */
class ConfigLoader {
public:
    ConfigLoader() = default;

    /**
     * @brief Load a JSON file
     * @param file_path file path
     * @return false when the file cannot be read or is not a JSON object
     */
    bool load_from_file(const std::filesystem::path& file_path);

    /**
     * @brief Load a JSON document; nested objects become dotted keys
     * @param json_content JSON text
     * @return false when the text is not a JSON object
     */
    bool load_from_json_string(const std::string& json_content);

    /**
     * @brief Override known keys from the environment
     *
     * Each key already present is looked up as PREFIX + KEY with dots
     * turned into underscores and upper-cased ("log.level" -> "SCCPLIB_LOG_LEVEL").
     * @param prefix variable name prefix
     * @return number of keys overridden
     */
    size_t load_from_environment(const std::string& prefix = "SCCPLIB_");

    /**
     * @brief Read "--key=value" arguments; other arguments are returned untouched
     * @param argc argument count
     * @param argv argument vector
     * @return arguments that were not options
     */
    std::vector<std::string> load_from_command_line(int argc, const char* const argv[]);

    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    int64_t get_int(const std::string& key, int64_t default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;
    std::vector<std::string> get_string_array(const std::string& key, const std::vector<std::string>& default_value = {}) const;

    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lk(config_mutex_);
        config_data_[key] = ConfigValue{value};
    }

    bool has(const std::string& key) const;
    bool remove(const std::string& key);
    void clear();

    void load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults);

    std::vector<std::string> get_all_keys() const;
    std::vector<std::string> get_keys_with_prefix(const std::string& prefix) const;

    /**
     * @brief Serialize as a nested JSON object
     *
     * A key whose path runs through a shorter key's value ("log" and
     * "log.level") is written under its full dotted name and a warning is logged.
     */
    std::string to_json_string() const;

private:
    mutable std::mutex config_mutex_;
    std::unordered_map<std::string, ConfigValue> config_data_;

    std::optional<ConfigValue> find_value(const std::string& key) const;
};

namespace config_utils {
    /**
     * @brief Environment variable name for a key
     * @param key dotted key
     * @param prefix prefix
     */
    std::string normalize_env_var_name(const std::string& key, const std::string& prefix = "");

    /**
     * @brief Parse "1"/"true"/"yes"/"on" (case-insensitive)
     */
    std::optional<bool> parse_bool(const std::string& str);

    /**
     * @brief Type a textual value: bool, integer, floating point, else string
     */
    ConfigValue parse_value(const std::string& str);
}

} // namespace sccplib::utils
