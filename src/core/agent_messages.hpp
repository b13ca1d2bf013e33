#pragma once

#include <string>
#include <variant>

#include "agent_protocol.pb.h"

namespace mbf_session {

namespace pb = mbf::agent::v1;

// One operation sent to the agent. Exactly one is in flight per session.
using Request =
    std::variant<pb::GetModStatus, pb::SetModsEnabled, pb::RemoveMod,
                 pb::Import, pb::ImportUrl, pb::GetDowngradedManifest,
                 pb::Patch, pb::QuickFix, pb::FixPlayerData>;

// Payload of the message that ends a successful session.
using TerminalResult =
    std::variant<pb::ModStatus, pb::Mods, pb::Patched, pb::ImportResult,
                 pb::DowngradedManifest, pb::FixedPlayerData>;

// Anything the agent may write to stdout.
using AgentMessage = std::variant<pb::LogMsg, TerminalResult>;

// Serializes a request to a single-line JSON object with `type` filled in.
// Throws mbf_link::ProtocolError if the message cannot be printed.
std::string encode_request(const Request &request);

// Decodes one frame. Throws mbf_link::ProtocolError carrying the raw frame
// text when it is not JSON or its `type` is not a known response.
AgentMessage decode_message(const std::string &frame);

// Discriminant of a request or result ("GetModStatus", "ModStatus", ...).
std::string type_name(const Request &request);
std::string type_name(const TerminalResult &result);

// "Trace" .. "Error"
const char *level_name(pb::LogMsg::Level level);

// Prints any message as JSON (snake_case field names). For output only.
std::string to_json(const google::protobuf::Message &message);

} // namespace mbf_session
