#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace sccplib::proto {

/**
 * @brief Protocol class parameter (Q.713 §3.6)
 *
 * Bits 0-3 carry the class, bit 7 the "return message on error" option.
 */
struct ProtocolClass {
  uint8_t value = 0;

  static ProtocolClass make(uint8_t protocol_class, bool return_on_error) noexcept {
    return ProtocolClass{static_cast<uint8_t>((protocol_class & 0x0Fu) | (return_on_error ? 0x80u : 0x00u))};
  }

  uint8_t protocol_class() const noexcept { return value & 0x0Fu; }
  bool return_on_error() const noexcept { return (value & 0x80u) != 0; }

  bool operator==(const ProtocolClass&) const = default;
};

/**
 * @brief Called/calling party address parameter (Q.713 §3.4, ITU format)
 *
 * Wire form: length octet, address indicator, optional 2-octet point code
 * (little-endian), optional subsystem number, global title. The global
 * title is carried as opaque octets.
 */
struct PartyAddress {
  static constexpr uint8_t kPointCodeIndicator = 0x01;
  static constexpr uint8_t kSubsystemIndicator = 0x02;
  static constexpr uint8_t kGlobalTitleMask = 0x3C;
  static constexpr uint8_t kRouteOnSsn = 0x40;

  uint8_t indicator = 0;
  uint16_t signalling_point_code = 0;
  uint8_t subsystem_number = 0;
  std::vector<uint8_t> global_title{};

  /**
   * @brief Build an address; the indicator is derived from what is present
   * @param point_code signalling point code, if any
   * @param ssn subsystem number, if any
   * @param gt_indicator global title indicator (0-15)
   * @param global_title global title octets
   * @param route_on_ssn routing indicator
   */
  static PartyAddress create(std::optional<uint16_t> point_code,
                             std::optional<uint8_t> ssn,
                             uint8_t gt_indicator = 0,
                             std::vector<uint8_t> global_title = {},
                             bool route_on_ssn = true);

  bool has_point_code() const noexcept { return (indicator & kPointCodeIndicator) != 0; }
  bool has_subsystem_number() const noexcept { return (indicator & kSubsystemIndicator) != 0; }
  uint8_t global_title_indicator() const noexcept { return static_cast<uint8_t>((indicator & kGlobalTitleMask) >> 2); }
  bool route_on_ssn() const noexcept { return (indicator & kRouteOnSsn) != 0; }

  // Octets following the length octet.
  size_t body_len() const noexcept;

  // body_len() plus the length octet.
  size_t marshal_len() const noexcept { return 1 + body_len(); }

  std::error_code marshal_to(std::span<uint8_t> out) const;

  /**
   * @brief Decode from `bytes`, which starts at the length octet
   *
   * Trailing bytes past the declared length are ignored.
   */
  std::error_code unmarshal_binary(std::span<const uint8_t> bytes);

  std::string to_string() const;

  bool operator==(const PartyAddress&) const = default;
};

} // namespace sccplib::proto
