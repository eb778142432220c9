#include "sccplib/settings.hpp"

#include <algorithm>
#include <cctype>

namespace sccplib {

void Settings::register_defaults(utils::ConfigLoader& config) {
  config.load_defaults({
    {"codec.strict_pointers", false},
    {"log.level", std::string("info")},
    {"log.file", std::string()},
    {"log.colors", true},
    {"log.format", std::string("text")},
  });
}

Settings Settings::from_config(const utils::ConfigLoader& config) {
  Settings s{};
  s.strict_pointers = config.get_bool("codec.strict_pointers", false);
  s.log_level = utils::log_utils::parse_log_level(config.get_string("log.level", "info"));
  s.log_file = config.get_string("log.file", "");
  s.log_colors = config.get_bool("log.colors", true);
  auto format = config.get_string("log.format", "text");
  std::transform(format.begin(), format.end(), format.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  s.log_json = format == "json";
  return s;
}

proto::ParseOptions Settings::parse_options() const {
  proto::ParseOptions o{};
  o.strict_pointers = strict_pointers;
  return o;
}

void apply_logging(const Settings& settings) {
  utils::log_utils::setup_basic_logging(settings.log_level, true, settings.log_file,
                                       settings.log_colors, settings.log_json);
}

} // namespace sccplib
