#pragma once

#include <functional>
#include <string>

#include "agent_protocol.pb.h"

namespace mbf_session {

// Observer for progress and agent log events. An empty function is valid and
// means silent mode: protocol behaviour is the same, nothing is forwarded.
using LogEventSink = std::function<void(const mbf::agent::v1::LogMsg &)>;

mbf::agent::v1::LogMsg make_log(mbf::agent::v1::LogMsg::Level level,
                                const std::string &message);

// Records msg locally and forwards it to sink as an Info event.
void log_info(const LogEventSink &sink, const std::string &msg);

// Same as log_info with an explicit level.
void log_event(const LogEventSink &sink, mbf::agent::v1::LogMsg::Level level,
               const std::string &msg);

// Echoes an agent log to the local diagnostic output, keyed by level.
void log_from_agent(const mbf::agent::v1::LogMsg &log);

} // namespace mbf_session
