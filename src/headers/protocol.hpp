#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include "room.hpp"

using json = nlohmann::json;

namespace protocol {

    enum class MessageType {
        Vote,
        Reveal,
        Reset,
        Unknown  // anything we do not understand; dropped by the caller
    };

    struct InboundMessage {
        MessageType type = MessageType::Unknown;
        json value;  // vote value, null when absent
    };

    // Connection-time parameters taken from the upgrade request target.
    struct JoinRequest {
        std::string roomId;
        std::string user;
    };

    // Never throws: unparseable text, non-object payloads and missing or
    // unrecognized types all come back as Unknown.
    InboundMessage parseMessage(std::string_view text);

    // {"type":"state","votes":{...},"revealed":bool}
    json stateMessage(const RoomState& state);
    std::string encodeState(const RoomState& state);

    // Splits "/ws?roomId=R1&user=alice" into path and query.
    std::string_view targetPath(std::string_view target);
    std::optional<std::string> queryValue(std::string_view target, std::string_view key);

    // Empty optional when either parameter is missing or empty.
    std::optional<JoinRequest> parseJoinRequest(std::string_view target);

    std::string urlDecode(std::string_view in);
    std::string urlEncode(std::string_view in);

    // Mean of the votes that start with a decimal number; "?" and friends
    // are skipped.
    std::optional<double> averageVote(const json& votes);

}
