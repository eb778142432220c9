#include "sccplib/proto/params.hpp"

#include <algorithm>
#include <sstream>

#include "sccplib/error.hpp"
#include "sccplib/utils/encoding.hpp"

namespace sccplib::proto {

PartyAddress PartyAddress::create(std::optional<uint16_t> point_code,
                                  std::optional<uint8_t> ssn,
                                  uint8_t gt_indicator,
                                  std::vector<uint8_t> global_title,
                                  bool route_on_ssn) {
  PartyAddress a{};
  a.indicator = static_cast<uint8_t>(((gt_indicator & 0x0Fu) << 2) | (route_on_ssn ? kRouteOnSsn : 0u));
  if (point_code) {
    a.indicator |= kPointCodeIndicator;
    a.signalling_point_code = *point_code;
  }
  if (ssn) {
    a.indicator |= kSubsystemIndicator;
    a.subsystem_number = *ssn;
  }
  a.global_title = std::move(global_title);
  return a;
}

size_t PartyAddress::body_len() const noexcept {
  size_t n = 1; // address indicator
  if (has_point_code()) n += 2;
  if (has_subsystem_number()) n += 1;
  return n + global_title.size();
}

std::error_code PartyAddress::marshal_to(std::span<uint8_t> out) const {
  const size_t body = body_len();
  if (body > 0xFFu) return make_error_code(SccpErrc::value_too_long);
  if (out.size() < 1 + body) return make_error_code(SccpErrc::unexpected_eof);

  size_t pos = 0;
  out[pos++] = static_cast<uint8_t>(body);
  out[pos++] = indicator;
  if (has_point_code()) {
    out[pos++] = static_cast<uint8_t>(signalling_point_code & 0xFF);
    out[pos++] = static_cast<uint8_t>((signalling_point_code >> 8) & 0xFF);
  }
  if (has_subsystem_number()) out[pos++] = subsystem_number;
  std::copy(global_title.begin(), global_title.end(), out.begin() + static_cast<std::ptrdiff_t>(pos));
  return {};
}

std::error_code PartyAddress::unmarshal_binary(std::span<const uint8_t> bytes) {
  if (bytes.empty()) return make_error_code(SccpErrc::unexpected_eof);
  const size_t len = bytes[0];
  if (bytes.size() < 1 + len) return make_error_code(SccpErrc::unexpected_eof);
  if (len == 0) return make_error_code(SccpErrc::invalid_parameter);

  auto body = bytes.subspan(1, len);
  size_t pos = 0;
  const uint8_t ind = body[pos++];

  uint16_t pc = 0;
  if (ind & kPointCodeIndicator) {
    if (pos + 2 > len) return make_error_code(SccpErrc::invalid_parameter);
    pc = static_cast<uint16_t>(body[pos] | (body[pos + 1] << 8));
    pos += 2;
  }
  uint8_t ssn = 0;
  if (ind & kSubsystemIndicator) {
    if (pos + 1 > len) return make_error_code(SccpErrc::invalid_parameter);
    ssn = body[pos++];
  }

  indicator = ind;
  signalling_point_code = pc;
  subsystem_number = ssn;
  global_title.assign(body.begin() + static_cast<std::ptrdiff_t>(pos), body.end());
  return {};
}

std::string PartyAddress::to_string() const {
  std::ostringstream ss;
  ss << "{Indicator: 0x" << utils::to_hex(std::span<const uint8_t>(&indicator, 1));
  if (has_point_code()) ss << ", SignallingPointCode: " << signalling_point_code;
  if (has_subsystem_number()) ss << ", SubsystemNumber: " << static_cast<int>(subsystem_number);
  ss << ", GlobalTitle: " << utils::to_hex(global_title) << '}';
  return ss.str();
}

} // namespace sccplib::proto
