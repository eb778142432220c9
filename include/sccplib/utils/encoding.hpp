#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sccplib::utils {

// Lowercase hex, no separators.
std::string to_hex(std::span<const uint8_t> bytes);

// Whitespace is skipped; odd digit count or any other character yields nullopt.
std::optional<std::vector<uint8_t>> from_hex(std::string_view text);

} // namespace sccplib::utils
