#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "sccplib/proto/message.hpp"
#include "sccplib/proto/params.hpp"

namespace sccplib::proto {

/**
 * @brief Unitdata (Q.713 §4.10)
 *
 * | 0 | type | 1 | protocol class | 2 | pointer1 | 3 | pointer2 | 4 | pointer3 |
 * followed by called party address, calling party address and data, each a
 * length octet plus contents, found at 2+pointer1, 3+pointer2 and 4+pointer3.
 */
class UDT final : public Message {
public:
  static constexpr size_t kFixedLength = 5;

  ProtocolClass protocol_class{};
  // Pointers as read from the wire. Encoding always writes canonical values.
  uint8_t pointer1 = 0;
  uint8_t pointer2 = 0;
  uint8_t pointer3 = 0;
  PartyAddress called_party_address{};
  PartyAddress calling_party_address{};
  std::vector<uint8_t> data{};

  UDT() = default;
  UDT(ProtocolClass protocol_class, PartyAddress called, PartyAddress calling, std::vector<uint8_t> data);

  static Result<UDT> parse(std::span<const uint8_t> bytes);

  uint8_t data_length() const noexcept { return static_cast<uint8_t>(data.size()); }

  std::error_code marshal_to(std::span<uint8_t> out) const override;
  size_t marshal_len() const noexcept override;
  std::error_code unmarshal_binary(std::span<const uint8_t> bytes) override;

  MessageType message_type() const noexcept override { return MessageType::UDT; }
  std::string_view message_type_name() const noexcept override { return "UDT"; }
  std::string to_string() const override;
  bool has_canonical_pointers() const noexcept override;

  bool operator==(const UDT& other) const noexcept {
    return protocol_class == other.protocol_class
        && pointer1 == other.pointer1
        && pointer2 == other.pointer2
        && pointer3 == other.pointer3
        && called_party_address == other.called_party_address
        && calling_party_address == other.calling_party_address
        && data == other.data;
  }

private:
  struct Pointers {
    size_t ptr1;
    size_t ptr2;
    size_t ptr3;
  };

  // Pointer values encode writes for the current parameters.
  Pointers canonical_pointers() const noexcept;
};

} // namespace sccplib::proto
