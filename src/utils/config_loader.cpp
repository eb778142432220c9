#include "sccplib/utils/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "sccplib/utils/env.hpp"
#include "sccplib/utils/log_config.hpp"

namespace sccplib::utils {

namespace {

std::string to_lower(const std::string& s) {
    std::string r;
    r.reserve(s.size());
    for (char c : s) r.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return r;
}

void flatten(const std::string& prefix, const nlohmann::json& j,
             std::unordered_map<std::string, ConfigValue>& out) {
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            flatten(key, v, out);
        } else if (v.is_boolean()) {
            out[key] = v.get<bool>();
        } else if (v.is_number_integer()) {
            out[key] = v.get<int64_t>();
        } else if (v.is_number_float()) {
            out[key] = v.get<double>();
        } else if (v.is_string()) {
            out[key] = v.get<std::string>();
        } else if (v.is_array()) {
            std::vector<std::string> items;
            for (const auto& e : v) items.push_back(e.is_string() ? e.get<std::string>() : e.dump());
            out[key] = std::move(items);
        }
    }
}

std::string value_to_string(const ConfigValue& v) {
    if (auto* s = std::get_if<std::string>(&v)) return *s;
    if (auto* i = std::get_if<int64_t>(&v)) return std::to_string(*i);
    if (auto* d = std::get_if<double>(&v)) {
        std::ostringstream ss;
        ss << *d;
        return ss.str();
    }
    if (auto* b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    const auto& items = std::get<std::vector<std::string>>(v);
    std::string r;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) r += ',';
        r += items[i];
    }
    return r;
}

// Place `value` at the dotted path `key`. False when a prefix of the path
// already holds a non-object or the final slot is occupied.
bool insert_nested(nlohmann::json& root, const std::string& key, const nlohmann::json& value) {
    nlohmann::json* node = &root;
    size_t start = 0;
    for (;;) {
        const size_t dot = key.find('.', start);
        const std::string segment = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (dot == std::string::npos) {
            if (node->contains(segment)) return false;
            (*node)[segment] = value;
            return true;
        }
        auto it = node->find(segment);
        if (it == node->end()) {
            node = &((*node)[segment] = nlohmann::json::object());
        } else if (it->is_object()) {
            node = &*it;
        } else {
            return false;
        }
        start = dot + 1;
    }
}

} // namespace

bool ConfigLoader::load_from_file(const std::filesystem::path& file_path) {
    std::ifstream ifs(file_path);
    if (!ifs) {
        auto logger = LogManager::instance().get_logger("sccp.config");
        SCCPLIB_LOG_WARNING(logger, "cannot open config file: " + file_path.string());
        return false;
    }
    std::stringstream ss;
    ss << ifs.rdbuf();
    return load_from_json_string(ss.str());
}

bool ConfigLoader::load_from_json_string(const std::string& json_content) {
    auto j = nlohmann::json::parse(json_content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        auto logger = LogManager::instance().get_logger("sccp.config");
        SCCPLIB_LOG_WARNING(logger, "config is not a JSON object");
        return false;
    }
    std::unordered_map<std::string, ConfigValue> parsed;
    flatten("", j, parsed);
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (auto& [k, v] : parsed) config_data_[k] = std::move(v);
    return true;
}

size_t ConfigLoader::load_from_environment(const std::string& prefix) {
    size_t n = 0;
    for (const auto& key : get_all_keys()) {
        auto value = get_env(config_utils::normalize_env_var_name(key, prefix));
        if (!value) continue;
        std::lock_guard<std::mutex> lk(config_mutex_);
        config_data_[key] = config_utils::parse_value(*value);
        ++n;
    }
    return n;
}

std::vector<std::string> ConfigLoader::load_from_command_line(int argc, const char* const argv[]) {
    std::vector<std::string> rest;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos && eq > 2) {
            std::lock_guard<std::mutex> lk(config_mutex_);
            config_data_[a.substr(2, eq - 2)] = config_utils::parse_value(a.substr(eq + 1));
        } else {
            rest.push_back(std::move(a));
        }
    }
    return rest;
}

std::optional<ConfigValue> ConfigLoader::find_value(const std::string& key) const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    auto it = config_data_.find(key);
    if (it == config_data_.end()) return std::nullopt;
    return it->second;
}

std::string ConfigLoader::get_string(const std::string& key, const std::string& def) const {
    auto v = find_value(key);
    return v ? value_to_string(*v) : def;
}

int64_t ConfigLoader::get_int(const std::string& key, int64_t def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i;
    if (auto* d = std::get_if<double>(&*v)) return static_cast<int64_t>(*d);
    if (auto* b = std::get_if<bool>(&*v)) return *b ? 1 : 0;
    if (auto* s = std::get_if<std::string>(&*v)) {
        int64_t out = 0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), out);
        if (ec == std::errc{} && ptr == s->data() + s->size()) return out;
    }
    return def;
}

double ConfigLoader::get_double(const std::string& key, double def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* d = std::get_if<double>(&*v)) return *d;
    if (auto* i = std::get_if<int64_t>(&*v)) return static_cast<double>(*i);
    if (auto* s = std::get_if<std::string>(&*v)) {
        char* end = nullptr;
        double out = std::strtod(s->c_str(), &end);
        if (!s->empty() && end == s->c_str() + s->size()) return out;
    }
    return def;
}

bool ConfigLoader::get_bool(const std::string& key, bool def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* b = std::get_if<bool>(&*v)) return *b;
    if (auto* i = std::get_if<int64_t>(&*v)) return *i != 0;
    if (auto* s = std::get_if<std::string>(&*v)) return config_utils::parse_bool(*s).value_or(def);
    return def;
}

std::vector<std::string> ConfigLoader::get_string_array(const std::string& key, const std::vector<std::string>& def) const {
    auto v = find_value(key);
    if (!v) return def;
    if (auto* a = std::get_if<std::vector<std::string>>(&*v)) return *a;
    return {value_to_string(*v)};
}

bool ConfigLoader::has(const std::string& key) const { return find_value(key).has_value(); }

bool ConfigLoader::remove(const std::string& key) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    return config_data_.erase(key) > 0;
}

void ConfigLoader::clear() {
    std::lock_guard<std::mutex> lk(config_mutex_);
    config_data_.clear();
}

void ConfigLoader::load_defaults(const std::unordered_map<std::string, ConfigValue>& defaults) {
    std::lock_guard<std::mutex> lk(config_mutex_);
    for (const auto& [k, v] : defaults) config_data_.emplace(k, v);
}

std::vector<std::string> ConfigLoader::get_all_keys() const {
    std::lock_guard<std::mutex> lk(config_mutex_);
    std::vector<std::string> keys;
    keys.reserve(config_data_.size());
    for (const auto& [k, _] : config_data_) keys.push_back(k);
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::vector<std::string> ConfigLoader::get_keys_with_prefix(const std::string& prefix) const {
    std::vector<std::string> keys;
    for (auto& k : get_all_keys()) {
        if (k.rfind(prefix, 0) == 0) keys.push_back(std::move(k));
    }
    return keys;
}

std::string ConfigLoader::to_json_string() const {
    nlohmann::json j = nlohmann::json::object();
    std::vector<std::string> conflicts;
    {
        std::lock_guard<std::mutex> lk(config_mutex_);
        std::vector<std::string> keys;
        keys.reserve(config_data_.size());
        for (const auto& [k, _] : config_data_) keys.push_back(k);
        std::sort(keys.begin(), keys.end());

        for (const auto& key : keys) {
            nlohmann::json value;
            std::visit([&](const auto& v) { value = v; }, config_data_.at(key));
            if (!insert_nested(j, key, value)) {
                // Nested path is taken by a shorter key; keep the dotted name.
                j[key] = std::move(value);
                conflicts.push_back(key);
            }
        }
    }
    if (!conflicts.empty()) {
        auto logger = LogManager::instance().get_logger("sccp.config");
        for (const auto& key : conflicts) {
            SCCPLIB_LOG_WARNING(logger, "config key '" + key + "' overlaps a shorter key, written unnested");
        }
    }
    return j.dump();
}

namespace config_utils {

std::string normalize_env_var_name(const std::string& key, const std::string& prefix) {
    std::string r = prefix;
    for (char c : key) {
        r += (c == '.' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return r;
}

std::optional<bool> parse_bool(const std::string& str) {
    const auto s = to_lower(str);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

ConfigValue parse_value(const std::string& str) {
    const auto lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;

    int64_t i = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), i);
    if (!str.empty() && ec == std::errc{} && ptr == str.data() + str.size()) return i;

    char* end = nullptr;
    double d = std::strtod(str.c_str(), &end);
    if (!str.empty() && end == str.c_str() + str.size()) return d;

    return str;
}

} // namespace config_utils

} // namespace sccplib::utils
