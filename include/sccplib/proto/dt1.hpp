#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "sccplib/proto/message.hpp"

namespace sccplib::proto {

using LocalReference = std::array<uint8_t, 3>;

/**
 * @brief Data form 1 (Q.713 §4.8)
 *
 * | 0 | type | 1-3 | destination local reference | 4 | segmenting/reassembling |
 * | 5 | pointer | 5+pointer | length | 6+pointer.. | data |
 */
class DT1 final : public Message {
public:
  // Smallest encoding: fixed part plus length octet, empty data.
  static constexpr size_t kMinLength = 7;
  static constexpr uint8_t kCanonicalPointer = 1;

  LocalReference destination_local_ref{};
  uint8_t segmenting_reassembling = 0;
  // Pointer as read from the wire. Encoding always writes kCanonicalPointer.
  uint8_t pointer = kCanonicalPointer;
  std::vector<uint8_t> data{};

  DT1() = default;
  DT1(const LocalReference& destination_local_ref, uint8_t segmenting_reassembling, std::vector<uint8_t> data);

  /**
   * @brief Decode a DT1 from a complete message buffer
   */
  static Result<DT1> parse(std::span<const uint8_t> bytes);

  // Value of the length octet; data.size() must not exceed kMaxVariableLength.
  uint8_t data_length() const noexcept { return static_cast<uint8_t>(data.size()); }

  std::error_code marshal_to(std::span<uint8_t> out) const override;
  size_t marshal_len() const noexcept override { return kMinLength + data.size(); }
  std::error_code unmarshal_binary(std::span<const uint8_t> bytes) override;

  MessageType message_type() const noexcept override { return MessageType::DT1; }
  std::string_view message_type_name() const noexcept override { return "DT1"; }
  std::string to_string() const override;
  bool has_canonical_pointers() const noexcept override { return pointer == kCanonicalPointer; }

  bool operator==(const DT1& other) const noexcept {
    return destination_local_ref == other.destination_local_ref
        && segmenting_reassembling == other.segmenting_reassembling
        && pointer == other.pointer
        && data == other.data;
  }
};

} // namespace sccplib::proto
