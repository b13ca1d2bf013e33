#pragma once

#include <memory>
#include <optional>
#include <string>

#include "core/agent_messages.hpp"
#include "core/demultiplexer.hpp"
#include "core/log_sink.hpp"
#include "device/device_transport.hpp"

namespace mbf_provision {
class AgentProvisioner;
}

namespace mbf_session {

enum class SessionState { Provisioning, Spawning, Sending, Streaming, Resolved };

const char *to_string(SessionState state);

/**
 * @brief Maps how the agent ended to the session's outcome.
 *
 * - exit 0, latched TerminalResult: that result.
 * - exit 0, latched Error log: AgentError carrying the log's message.
 * - exit 0, nothing latched: AgentError ("no response").
 * - exit != 0: ProtocolError including stderr_text, whatever was latched.
 */
TerminalResult resolve_outcome(int exit_code,
                               const std::optional<Latched> &latched,
                               const std::string &stderr_text);

/**
 * @brief One request/response exchange with a freshly spawned agent.
 *
 * run() walks Provisioning -> Spawning -> Sending -> Streaming -> Resolved.
 * While streaming it waits on whichever comes first of: new stdout data,
 * process exit (published after stdout reached its end), or device
 * disconnect. No other timeout applies in that phase.
 *
 * A Session is single use and owns its agent process for the duration of
 * run(); sessions must not overlap on one device.
 */
class Session {
public:
  // provisioner may be null to skip the agent check (tests, prepared agents).
  Session(std::shared_ptr<mbf_device::DeviceTransport> device,
          mbf_provision::AgentProvisioner *provisioner, std::string agent_path,
          LogEventSink sink);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Throws a mbf_link::AgentFailure subclass on any failure. The reason is
  // also delivered to the observer unless it came from an agent Error log.
  TerminalResult run(const Request &request);

  SessionState state() const { return state_; }

private:
  TerminalResult run_phases(const Request &request);
  void send_request(mbf_device::AgentProcess &process, const Request &request);

  std::shared_ptr<mbf_device::DeviceTransport> device_;
  mbf_provision::AgentProvisioner *provisioner_;
  std::string agent_path_;
  LogEventSink sink_;
  SessionState state_ = SessionState::Provisioning;
  bool used_ = false;
};

} // namespace mbf_session
