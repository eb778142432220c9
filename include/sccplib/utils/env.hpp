#pragma once

#include <optional>
#include <string>

namespace sccplib::utils {

// getenv wrapper; nullopt when the variable is unset.
std::optional<std::string> get_env(const std::string& key);

} // namespace sccplib::utils
