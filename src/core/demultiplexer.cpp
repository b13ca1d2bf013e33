#include "demultiplexer.hpp"

namespace mbf_session {

std::optional<Latched> reduce(std::optional<Latched> current,
                              const AgentMessage &message) {
  if (const auto *result = std::get_if<TerminalResult>(&message)) {
    return Latched{*result};
  }

  const auto &log = std::get<pb::LogMsg>(message);
  if (log.level() != pb::LogMsg::Error) {
    return current;
  }
  return Latched{log};
}

void Demultiplexer::dispatch(const AgentMessage &message) {
  if (const auto *log = std::get_if<pb::LogMsg>(&message)) {
    ++logs_seen_;
    log_from_agent(*log);
    if (sink_) {
      sink_(*log);
    }
  }

  latched_ = reduce(std::move(latched_), message);
}

} // namespace mbf_session
