#include "sccplib/proto/message_json.hpp"

#include "sccplib/utils/encoding.hpp"

namespace sccplib::proto {

void to_json(nlohmann::json& j, const ProtocolClass& pc) {
  j = nlohmann::json{
    {"class", pc.protocol_class()},
    {"return_on_error", pc.return_on_error()},
  };
}

void to_json(nlohmann::json& j, const PartyAddress& a) {
  j = nlohmann::json::object();
  j["indicator"] = a.indicator;
  j["route_on_ssn"] = a.route_on_ssn();
  j["global_title_indicator"] = a.global_title_indicator();
  if (a.has_point_code()) j["signalling_point_code"] = a.signalling_point_code;
  if (a.has_subsystem_number()) j["subsystem_number"] = a.subsystem_number;
  j["global_title"] = utils::to_hex(a.global_title);
}

void to_json(nlohmann::json& j, const DT1& m) {
  j = nlohmann::json{
    {"type", std::string(m.message_type_name())},
    {"destination_local_ref", utils::to_hex(m.destination_local_ref)},
    {"segmenting_reassembling", m.segmenting_reassembling},
    {"pointer", m.pointer},
    {"data_length", m.data.size()},
    {"data", utils::to_hex(m.data)},
  };
}

void to_json(nlohmann::json& j, const UDT& m) {
  j = nlohmann::json{
    {"type", std::string(m.message_type_name())},
    {"protocol_class", m.protocol_class},
    {"pointers", {m.pointer1, m.pointer2, m.pointer3}},
    {"called_party_address", m.called_party_address},
    {"calling_party_address", m.calling_party_address},
    {"data_length", m.data.size()},
    {"data", utils::to_hex(m.data)},
  };
}

nlohmann::json message_to_json(const Message& msg) {
  switch (msg.message_type()) {
    case MessageType::DT1:
      if (auto* d = dynamic_cast<const DT1*>(&msg)) return nlohmann::json(*d);
      break;
    case MessageType::UDT:
      if (auto* u = dynamic_cast<const UDT*>(&msg)) return nlohmann::json(*u);
      break;
    default:
      break;
  }
  return nlohmann::json{
    {"type", std::string(msg.message_type_name())},
    {"text", msg.to_string()},
  };
}

} // namespace sccplib::proto
