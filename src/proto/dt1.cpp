#include "sccplib/proto/dt1.hpp"

#include <algorithm>
#include <sstream>

#include "sccplib/utils/encoding.hpp"

namespace sccplib::proto {

DT1::DT1(const LocalReference& ref, uint8_t segmenting, std::vector<uint8_t> payload)
    : destination_local_ref(ref),
      segmenting_reassembling(segmenting),
      pointer(kCanonicalPointer),
      data(std::move(payload)) {}

Result<DT1> DT1::parse(std::span<const uint8_t> bytes) {
  DT1 d{};
  if (auto ec = d.unmarshal_binary(bytes)) return ec;
  return d;
}

std::error_code DT1::marshal_to(std::span<uint8_t> out) const {
  if (data.size() > kMaxVariableLength) return make_error_code(SccpErrc::value_too_long);
  if (out.size() < marshal_len()) return make_error_code(SccpErrc::unexpected_eof);

  out[0] = static_cast<uint8_t>(MessageType::DT1);
  std::copy(destination_local_ref.begin(), destination_local_ref.end(), out.begin() + 1);
  out[4] = segmenting_reassembling;
  out[5] = kCanonicalPointer;
  out[5 + kCanonicalPointer] = data_length();
  std::copy(data.begin(), data.end(), out.begin() + 6 + kCanonicalPointer);
  return {};
}

std::error_code DT1::unmarshal_binary(std::span<const uint8_t> bytes) {
  if (bytes.size() < kMinLength) return make_error_code(SccpErrc::unexpected_eof);
  if (bytes[0] != static_cast<uint8_t>(MessageType::DT1)) return make_error_code(SccpErrc::type_mismatch);

  // Any pointer value is accepted; 0 makes the pointer octet its own length octet.
  const uint8_t ptr = bytes[5];
  const size_t length_offset = size_t{5} + ptr;
  if (bytes.size() <= length_offset) return make_error_code(SccpErrc::unexpected_eof);

  const size_t len = bytes[length_offset];
  const size_t offset = length_offset + 1;
  if (bytes.size() < offset + len) return make_error_code(SccpErrc::unexpected_eof);

  std::copy(bytes.begin() + 1, bytes.begin() + 4, destination_local_ref.begin());
  segmenting_reassembling = bytes[4];
  pointer = ptr;
  data.assign(bytes.begin() + static_cast<std::ptrdiff_t>(offset),
              bytes.begin() + static_cast<std::ptrdiff_t>(offset + len));
  return {};
}

std::string DT1::to_string() const {
  std::ostringstream ss;
  ss << "{Type: " << message_type_name()
     << ", DestinationLocalRef: " << utils::to_hex(destination_local_ref)
     << ", SegmentingReassembling: 0x" << utils::to_hex(std::span<const uint8_t>(&segmenting_reassembling, 1))
     << ", Pointer: " << static_cast<int>(pointer)
     << ", DataLength: " << data.size()
     << ", Data: " << utils::to_hex(data) << '}';
  return ss.str();
}

} // namespace sccplib::proto
