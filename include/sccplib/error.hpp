#pragma once

#include <string>
#include <system_error>

namespace sccplib {

enum class SccpErrc {
  ok = 0,
  unexpected_eof = 1,      // buffer shorter than the grammar requires
  unimplemented_type = 2,  // known message type without a codec
  unknown_type = 3,        // byte is not a message type
  value_too_long = 4,      // variable part does not fit its length octet
  invalid_pointer = 5,
  type_mismatch = 6,
  invalid_parameter = 7,
};

// Portable groupings of SccpErrc for callers that only care about the kind.
enum class SccpCondition {
  truncated_buffer = 1,
  unsupported_type = 2,
};

class SccpErrorCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "sccplib"; }
  std::string message(int ev) const override {
    switch (static_cast<SccpErrc>(ev)) {
      case SccpErrc::ok: return "ok";
      case SccpErrc::unexpected_eof: return "unexpected end of buffer";
      case SccpErrc::unimplemented_type: return "message type not implemented";
      case SccpErrc::unknown_type: return "unknown message type";
      case SccpErrc::value_too_long: return "value exceeds 255 octets";
      case SccpErrc::invalid_pointer: return "invalid pointer";
      case SccpErrc::type_mismatch: return "message type mismatch";
      case SccpErrc::invalid_parameter: return "invalid parameter";
      default: return "unknown error";
    }
  }
  bool equivalent(int code, const std::error_condition& cond) const noexcept override;
};

class SccpConditionCategory final : public std::error_category {
public:
  const char* name() const noexcept override { return "sccplib.condition"; }
  std::string message(int ev) const override {
    switch (static_cast<SccpCondition>(ev)) {
      case SccpCondition::truncated_buffer: return "truncated buffer";
      case SccpCondition::unsupported_type: return "unsupported type";
      default: return "unknown condition";
    }
  }
};

inline const std::error_category& sccp_error_category() {
  static SccpErrorCategory cat;
  return cat;
}

inline const std::error_category& sccp_condition_category() {
  static SccpConditionCategory cat;
  return cat;
}

inline std::error_code make_error_code(SccpErrc e) {
  return {static_cast<int>(e), sccp_error_category()};
}

inline std::error_condition make_error_condition(SccpCondition c) {
  return {static_cast<int>(c), sccp_condition_category()};
}

inline bool SccpErrorCategory::equivalent(int code, const std::error_condition& cond) const noexcept {
  if (cond.category() != sccp_condition_category()) return false;
  switch (static_cast<SccpCondition>(cond.value())) {
    case SccpCondition::truncated_buffer:
      return code == static_cast<int>(SccpErrc::unexpected_eof);
    case SccpCondition::unsupported_type:
      return code == static_cast<int>(SccpErrc::unimplemented_type)
          || code == static_cast<int>(SccpErrc::unknown_type);
    default:
      return false;
  }
}

} // namespace sccplib

namespace std {
template<> struct is_error_code_enum<sccplib::SccpErrc> : true_type {};
template<> struct is_error_condition_enum<sccplib::SccpCondition> : true_type {};
}
