#pragma once

#include <string>

#include "sccplib/proto/message.hpp"
#include "sccplib/utils/config_loader.hpp"
#include "sccplib/utils/log_config.hpp"

namespace sccplib {

/**
 * @brief Library and tool settings
 *
 * | key                   | type   | default |
 * |-----------------------|--------|---------|
 * | codec.strict_pointers | bool   | false   |
 * | log.level             | string | info    |
 * | log.file              | string | (none)  |
 * | log.colors            | bool   | true    |
 * | log.format            | string | text    |
 *
 * log.format is "text" or "json"; anything else means text.
 */
struct Settings {
  bool strict_pointers = false;
  utils::LogLevel log_level = utils::LogLevel::Info;
  std::string log_file{};
  bool log_colors = true;
  bool log_json = false;

  // Seed `config` with every key above at its default value.
  static void register_defaults(utils::ConfigLoader& config);

  static Settings from_config(const utils::ConfigLoader& config);

  proto::ParseOptions parse_options() const;
};

// Route all library loggers to stderr (and log_file if set) at log_level,
// in the text or JSON line format.
void apply_logging(const Settings& settings);

} // namespace sccplib
