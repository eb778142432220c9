#include "sccplib/utils/env.hpp"

#include <cstdlib>

namespace sccplib::utils {

std::optional<std::string> get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace sccplib::utils
