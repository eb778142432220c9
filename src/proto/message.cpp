#include "sccplib/proto/message.hpp"

#include <iomanip>
#include <sstream>

#include "sccplib/proto/dt1.hpp"
#include "sccplib/proto/udt.hpp"
#include "sccplib/utils/log_config.hpp"

namespace sccplib::proto {

Result<std::vector<std::uint8_t>> Message::marshal_binary() const {
  std::vector<std::uint8_t> out(marshal_len());
  if (auto ec = marshal_to(out)) return ec;
  return out;
}

std::string ParseError::message() const {
  std::ostringstream ss;
  ss << code.message() << " (type 0x" << std::hex << std::setw(2) << std::setfill('0')
     << static_cast<int>(type) << ')';
  return ss.str();
}

namespace {

std::shared_ptr<utils::Logger> codec_logger() {
  return utils::LogManager::instance().get_logger("sccp.codec");
}

// Empty instance for every message type with a codec, nullptr otherwise.
MessagePtr make_message(MessageType type) {
  switch (type) {
    case MessageType::DT1: return std::make_unique<DT1>();
    case MessageType::UDT: return std::make_unique<UDT>();
    case MessageType::CR:
    case MessageType::CC:
    case MessageType::CREF:
    case MessageType::RLSD:
    case MessageType::RLC:
    case MessageType::DT2:
    case MessageType::AK:
    case MessageType::UDTS:
    case MessageType::ED:
    case MessageType::EA:
    case MessageType::RSR:
    case MessageType::RSC:
    case MessageType::ERR:
    case MessageType::IT:
    case MessageType::XUDT:
    case MessageType::XUDTS:
    case MessageType::LUDT:
    case MessageType::LUDTS:
      return nullptr;
  }
  return nullptr;
}

Result<MessagePtr, ParseError> fail(SccpErrc code, std::uint8_t type) {
  ParseError err{make_error_code(code), type};
  SCCPLIB_LOG_DEBUG(codec_logger(), "parse failed: " + err.message());
  return err;
}

} // namespace

Result<MessagePtr, ParseError> parse_message(std::span<const std::uint8_t> bytes, const ParseOptions& options) {
  if (bytes.empty()) return fail(SccpErrc::unexpected_eof, 0);

  const std::uint8_t raw = bytes[0];
  if (!is_known_message_type(raw)) return fail(SccpErrc::unknown_type, raw);

  auto msg = make_message(static_cast<MessageType>(raw));
  if (!msg) return fail(SccpErrc::unimplemented_type, raw);

  if (auto ec = msg->unmarshal_binary(bytes)) {
    ParseError err{ec, raw};
    SCCPLIB_LOG_DEBUG(codec_logger(), std::string("parse ") + std::string(msg->message_type_name()) + " failed: " + err.message());
    return err;
  }
  if (options.strict_pointers && !msg->has_canonical_pointers()) {
    return fail(SccpErrc::invalid_pointer, raw);
  }
  auto logger = codec_logger();
  if (logger->should_log(utils::LogLevel::Trace)) {
    SCCPLIB_LOG_TRACE(logger, "parsed " + msg->to_string());
  }
  return msg;
}

} // namespace sccplib::proto
