#pragma once

#include <optional>
#include <utility>
#include <variant>

#include "core/agent_messages.hpp"
#include "core/log_sink.hpp"

namespace mbf_session {

// Value that decides how a session ends: the last result or Error log seen.
using Latched = std::variant<pb::LogMsg, TerminalResult>;

/**
 * @brief Reducer applied to every decoded message, in arrival order.
 *
 * - TerminalResult: always replaces the latched value.
 * - Error-level LogMsg: always replaces the latched value.
 * - Any other LogMsg: leaves the latched value untouched.
 */
std::optional<Latched> reduce(std::optional<Latched> current,
                              const AgentMessage &message);

/**
 * @brief Routes decoded agent messages.
 *
 * Log events go to the observer (if any) and to the local diagnostic output;
 * every message is folded into the latched value with reduce(). Never blocks.
 */
class Demultiplexer {
public:
  explicit Demultiplexer(LogEventSink sink) : sink_(std::move(sink)) {}

  void dispatch(const AgentMessage &message);

  const std::optional<Latched> &latched() const { return latched_; }

  size_t logs_seen() const { return logs_seen_; }

private:
  LogEventSink sink_;
  std::optional<Latched> latched_;
  size_t logs_seen_ = 0;
};

} // namespace mbf_session
