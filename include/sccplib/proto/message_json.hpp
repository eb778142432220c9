#pragma once

#include <nlohmann/json.hpp>

#include "sccplib/proto/dt1.hpp"
#include "sccplib/proto/message.hpp"
#include "sccplib/proto/params.hpp"
#include "sccplib/proto/udt.hpp"

namespace sccplib::proto {

// Byte strings are rendered as lowercase hex.
void to_json(nlohmann::json& j, const ProtocolClass& pc);
void to_json(nlohmann::json& j, const PartyAddress& address);
void to_json(nlohmann::json& j, const DT1& msg);
void to_json(nlohmann::json& j, const UDT& msg);

/**
 * @brief JSON rendering of any message, selected by its message type
 */
nlohmann::json message_to_json(const Message& msg);

} // namespace sccplib::proto
