#pragma once

#include <cstdint>
#include <string_view>

namespace sccplib::proto {

// SCCP message types (ITU-T Q.713 §4.1)
enum class MessageType : uint8_t {
  CR = 0x01,     // Connection request
  CC = 0x02,     // Connection confirm
  CREF = 0x03,   // Connection refused
  RLSD = 0x04,   // Released
  RLC = 0x05,    // Release complete
  DT1 = 0x06,    // Data form 1
  DT2 = 0x07,    // Data form 2
  AK = 0x08,     // Data acknowledgement
  UDT = 0x09,    // Unitdata
  UDTS = 0x0a,   // Unitdata service
  ED = 0x0b,     // Expedited data
  EA = 0x0c,     // Expedited data acknowledgement
  RSR = 0x0d,    // Reset request
  RSC = 0x0e,    // Reset confirm
  ERR = 0x0f,    // Protocol data unit error
  IT = 0x10,     // Inactivity test
  XUDT = 0x11,   // Extended unitdata
  XUDTS = 0x12,  // Extended unitdata service
  LUDT = 0x13,   // Long unitdata
  LUDTS = 0x14,  // Long unitdata service
};

constexpr uint8_t kFirstMessageType = 0x01;
constexpr uint8_t kLastMessageType = 0x14;

constexpr bool is_known_message_type(uint8_t raw) noexcept {
  return raw >= kFirstMessageType && raw <= kLastMessageType;
}

/**
 * @brief Short mnemonic of a message type ("DT1", "UDT", ...)
 * @return "Unknown" for values outside the enumeration
 */
std::string_view message_type_name(MessageType type) noexcept;

} // namespace sccplib::proto
