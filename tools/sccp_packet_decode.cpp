#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "sccplib/proto/message.hpp"
#include "sccplib/proto/message_json.hpp"
#include "sccplib/settings.hpp"
#include "sccplib/utils/config_loader.hpp"
#include "sccplib/utils/encoding.hpp"

using namespace sccplib;

static bool read_all(const std::filesystem::path& p, std::vector<std::uint8_t>& out) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(p, ec)) return false;
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return false;
  ifs.seekg(0, std::ios::end);
  auto n = ifs.tellg();
  if (n < 0) return false;
  ifs.seekg(0, std::ios::beg);
  out.resize(static_cast<size_t>(n));
  if (n > 0) ifs.read(reinterpret_cast<char*>(out.data()), n);
  return static_cast<bool>(ifs);
}

static void usage() {
  std::cerr << "Usage: sccp_packet_decode [--config=FILE] [--key=value...] (--hex=HEX | FILE)\n";
}

int main(int argc, char** argv) {
  utils::ConfigLoader config;
  Settings::register_defaults(config);

  // --hex and --config are handled here; the rest are config overrides.
  std::string hex;
  std::string config_file;
  std::vector<const char*> args{argv[0]};
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a.rfind("--hex=", 0) == 0) hex = a.substr(6);
    else if (a.rfind("--config=", 0) == 0) config_file = a.substr(9);
    else args.push_back(argv[i]);
  }

  if (!config_file.empty() && !config.load_from_file(config_file)) {
    std::cerr << "failed to load config: " << config_file << "\n";
    return 2;
  }
  config.load_from_environment();
  auto rest = config.load_from_command_line(static_cast<int>(args.size()), args.data());

  const auto settings = Settings::from_config(config);
  apply_logging(settings);

  std::vector<std::uint8_t> bytes;
  if (!hex.empty()) {
    auto decoded = utils::from_hex(hex);
    if (!decoded) { std::cerr << "invalid hex input\n"; return 2; }
    bytes = std::move(*decoded);
  } else if (rest.size() == 1) {
    if (!read_all(rest[0], bytes)) { std::cerr << "failed to read file: " << rest[0] << "\n"; return 1; }
  } else {
    usage();
    return 2;
  }

  auto res = proto::parse_message(bytes, settings.parse_options());
  if (!res) {
    std::cerr << "decode error: " << res.error().message() << "\n";
    return 1;
  }
  std::cout << proto::message_to_json(*res.value()).dump(2) << "\n";
  return 0;
}
