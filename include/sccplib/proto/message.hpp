#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "sccplib/error.hpp"
#include "sccplib/expected.hpp"
#include "sccplib/proto/types.hpp"

namespace sccplib::proto {

// Largest variable part a single length octet can describe.
constexpr size_t kMaxVariableLength = 0xFFu;

/**
 * @brief Common interface of all SCCP messages
 *
 * Decoding always copies the bytes it keeps, so a decoded message never
 * refers to the buffer it was read from.
 */
class Message {
public:
  virtual ~Message() = default;

  /**
   * @brief Encode into a freshly allocated buffer of exactly marshal_len() bytes
   */
  Result<std::vector<std::uint8_t>> marshal_binary() const;

  /**
   * @brief Encode into a caller supplied buffer
   *
   * All length checks happen before the first write, so on failure `out`
   * is left as it was. Bytes past marshal_len() are never touched.
   * @return empty error_code on success
   */
  virtual std::error_code marshal_to(std::span<std::uint8_t> out) const = 0;

  /**
   * @brief Exact number of bytes marshal_to() writes
   */
  virtual size_t marshal_len() const noexcept = 0;

  /**
   * @brief Populate every field from `bytes`
   * @return empty error_code on success
   */
  virtual std::error_code unmarshal_binary(std::span<const std::uint8_t> bytes) = 0;

  virtual MessageType message_type() const noexcept = 0;
  virtual std::string_view message_type_name() const noexcept = 0;
  virtual std::string to_string() const = 0;

  /**
   * @brief Whether the pointer fields hold the values encode would write
   *
   * Decoding accepts padding between a pointer and its target; this reports
   * whether the decoded message used any.
   */
  virtual bool has_canonical_pointers() const noexcept = 0;
};

using MessagePtr = std::unique_ptr<Message>;

struct ParseOptions {
  // Reject messages whose pointers leave padding before their target.
  bool strict_pointers = false;
};

// Dispatch failure; `type` is the raw first byte of the buffer (0 when empty).
struct ParseError {
  std::error_code code{};
  std::uint8_t type = 0;

  std::string message() const;
};

/**
 * @brief Decode a complete message, selecting the grammar by its type byte
 *
 * Reserved message types fail with SccpErrc::unimplemented_type, bytes
 * outside the enumeration with SccpErrc::unknown_type. Both compare equal
 * to SccpCondition::unsupported_type.
 */
Result<MessagePtr, ParseError> parse_message(std::span<const std::uint8_t> bytes,
                                             const ParseOptions& options = {});

} // namespace sccplib::proto
