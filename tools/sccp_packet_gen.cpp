#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "sccplib/proto/dt1.hpp"
#include "sccplib/proto/udt.hpp"
#include "sccplib/utils/encoding.hpp"

using namespace sccplib;

static std::optional<std::uint8_t> parse_byte(const std::string& s) {
  auto b = utils::from_hex(s);
  if (!b || b->size() != 1) return std::nullopt;
  return (*b)[0];
}

static int usage() {
  std::cerr << "Usage:\n"
            << "  sccp_packet_gen dt1 REF(3 octets hex) FLAGS(hex) DATA(hex)\n"
            << "  sccp_packet_gen udt CLASS(hex) CALLED(hex) CALLING(hex) DATA(hex)\n"
            << "    CALLED/CALLING: party address including its length octet\n";
  return 2;
}

static int emit(const proto::Message& msg) {
  auto out = msg.marshal_binary();
  if (!out) {
    std::cerr << "encode error: " << out.error().message() << "\n";
    return 1;
  }
  std::cout << utils::to_hex(out.value()) << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) return usage();
  const std::string kind = argv[1];

  if (kind == "dt1" && argc == 5) {
    auto ref = utils::from_hex(argv[2]);
    auto flags = parse_byte(argv[3]);
    auto data = utils::from_hex(argv[4]);
    if (!ref || ref->size() != 3 || !flags || !data) return usage();
    proto::LocalReference lr{(*ref)[0], (*ref)[1], (*ref)[2]};
    return emit(proto::DT1(lr, *flags, std::move(*data)));
  }

  if (kind == "udt" && argc == 6) {
    auto cls = parse_byte(argv[2]);
    auto called_raw = utils::from_hex(argv[3]);
    auto calling_raw = utils::from_hex(argv[4]);
    auto data = utils::from_hex(argv[5]);
    if (!cls || !called_raw || !calling_raw || !data) return usage();

    proto::PartyAddress called{};
    proto::PartyAddress calling{};
    if (auto ec = called.unmarshal_binary(*called_raw)) {
      std::cerr << "called party address: " << ec.message() << "\n";
      return 1;
    }
    if (auto ec = calling.unmarshal_binary(*calling_raw)) {
      std::cerr << "calling party address: " << ec.message() << "\n";
      return 1;
    }
    return emit(proto::UDT(proto::ProtocolClass{*cls}, std::move(called), std::move(calling), std::move(*data)));
  }

  return usage();
}
