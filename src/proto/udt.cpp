#include "sccplib/proto/udt.hpp"

#include <algorithm>
#include <sstream>

#include "sccplib/utils/encoding.hpp"

namespace sccplib::proto {

UDT::UDT(ProtocolClass pc, PartyAddress called, PartyAddress calling, std::vector<uint8_t> payload)
    : protocol_class(pc),
      called_party_address(std::move(called)),
      calling_party_address(std::move(calling)),
      data(std::move(payload)) {
  // Out-of-range values are caught by marshal_to().
  const auto p = canonical_pointers();
  pointer1 = static_cast<uint8_t>(p.ptr1);
  pointer2 = static_cast<uint8_t>(p.ptr2);
  pointer3 = static_cast<uint8_t>(p.ptr3);
}

Result<UDT> UDT::parse(std::span<const uint8_t> bytes) {
  UDT u{};
  if (auto ec = u.unmarshal_binary(bytes)) return ec;
  return u;
}

UDT::Pointers UDT::canonical_pointers() const noexcept {
  Pointers p{};
  p.ptr1 = 3;
  p.ptr2 = p.ptr1 + called_party_address.marshal_len() - 1;
  p.ptr3 = p.ptr2 + calling_party_address.marshal_len() - 1;
  return p;
}

size_t UDT::marshal_len() const noexcept {
  return kFixedLength + called_party_address.marshal_len() + calling_party_address.marshal_len() + 1 + data.size();
}

bool UDT::has_canonical_pointers() const noexcept {
  const auto p = canonical_pointers();
  return pointer1 == p.ptr1 && pointer2 == p.ptr2 && pointer3 == p.ptr3;
}

std::error_code UDT::marshal_to(std::span<uint8_t> out) const {
  if (called_party_address.body_len() > kMaxVariableLength ||
      calling_party_address.body_len() > kMaxVariableLength ||
      data.size() > kMaxVariableLength) {
    return make_error_code(SccpErrc::value_too_long);
  }
  const auto p = canonical_pointers();
  if (p.ptr3 > 0xFFu) return make_error_code(SccpErrc::value_too_long);
  if (out.size() < marshal_len()) return make_error_code(SccpErrc::unexpected_eof);

  out[0] = static_cast<uint8_t>(MessageType::UDT);
  out[1] = protocol_class.value;
  out[2] = static_cast<uint8_t>(p.ptr1);
  out[3] = static_cast<uint8_t>(p.ptr2);
  out[4] = static_cast<uint8_t>(p.ptr3);

  if (auto ec = called_party_address.marshal_to(out.subspan(2 + p.ptr1))) return ec;
  if (auto ec = calling_party_address.marshal_to(out.subspan(3 + p.ptr2))) return ec;

  const size_t offset = 4 + p.ptr3;
  out[offset] = data_length();
  std::copy(data.begin(), data.end(), out.begin() + static_cast<std::ptrdiff_t>(offset + 1));
  return {};
}

std::error_code UDT::unmarshal_binary(std::span<const uint8_t> bytes) {
  if (bytes.size() < kFixedLength) return make_error_code(SccpErrc::unexpected_eof);
  if (bytes[0] != static_cast<uint8_t>(MessageType::UDT)) return make_error_code(SccpErrc::type_mismatch);

  const uint8_t p1 = bytes[2];
  const uint8_t p2 = bytes[3];
  const uint8_t p3 = bytes[4];
  // Every pointer must land past the fixed part.
  if (size_t{2} + p1 < kFixedLength || size_t{3} + p2 < kFixedLength || size_t{4} + p3 < kFixedLength) {
    return make_error_code(SccpErrc::invalid_pointer);
  }

  const size_t called_offset = size_t{2} + p1;
  const size_t calling_offset = size_t{3} + p2;
  const size_t data_offset = size_t{4} + p3;
  if (bytes.size() <= called_offset || bytes.size() <= calling_offset || bytes.size() <= data_offset) {
    return make_error_code(SccpErrc::unexpected_eof);
  }

  PartyAddress called{};
  if (auto ec = called.unmarshal_binary(bytes.subspan(called_offset))) return ec;
  PartyAddress calling{};
  if (auto ec = calling.unmarshal_binary(bytes.subspan(calling_offset))) return ec;

  const size_t len = bytes[data_offset];
  if (bytes.size() < data_offset + 1 + len) return make_error_code(SccpErrc::unexpected_eof);

  protocol_class = ProtocolClass{bytes[1]};
  pointer1 = p1;
  pointer2 = p2;
  pointer3 = p3;
  called_party_address = std::move(called);
  calling_party_address = std::move(calling);
  data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(data_offset + 1),
              bytes.begin() + static_cast<std::ptrdiff_t>(data_offset + 1 + len));
  return {};
}

std::string UDT::to_string() const {
  std::ostringstream ss;
  ss << "{Type: " << message_type_name()
     << ", ProtocolClass: " << static_cast<int>(protocol_class.protocol_class())
     << ", ReturnOnError: " << (protocol_class.return_on_error() ? "true" : "false")
     << ", CalledPartyAddress: " << called_party_address.to_string()
     << ", CallingPartyAddress: " << calling_party_address.to_string()
     << ", DataLength: " << data.size()
     << ", Data: " << utils::to_hex(data) << '}';
  return ss.str();
}

} // namespace sccplib::proto
