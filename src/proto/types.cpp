#include "sccplib/proto/types.hpp"

namespace sccplib::proto {

std::string_view message_type_name(MessageType type) noexcept {
  switch (type) {
    case MessageType::CR: return "CR";
    case MessageType::CC: return "CC";
    case MessageType::CREF: return "CREF";
    case MessageType::RLSD: return "RLSD";
    case MessageType::RLC: return "RLC";
    case MessageType::DT1: return "DT1";
    case MessageType::DT2: return "DT2";
    case MessageType::AK: return "AK";
    case MessageType::UDT: return "UDT";
    case MessageType::UDTS: return "UDTS";
    case MessageType::ED: return "ED";
    case MessageType::EA: return "EA";
    case MessageType::RSR: return "RSR";
    case MessageType::RSC: return "RSC";
    case MessageType::ERR: return "ERR";
    case MessageType::IT: return "IT";
    case MessageType::XUDT: return "XUDT";
    case MessageType::XUDTS: return "XUDTS";
    case MessageType::LUDT: return "LUDT";
    case MessageType::LUDTS: return "LUDTS";
  }
  return "Unknown";
}

} // namespace sccplib::proto
