#pragma once

#include <stdexcept>
#include <string>

namespace mbf_link {

// Failure kinds surfaced by a session or by provisioning.
enum class FailureKind {
  Transport,   // device unreachable, disconnected, remote fs op failed
  Protocol,    // malformed frame, unknown message, agent exited non-zero
  Agent,       // agent reported an error (or nothing at all)
  Provisioning // agent download exhausted retries, upload timed out
};

inline const char *to_string(FailureKind kind) {
  switch (kind) {
  case FailureKind::Transport:
    return "transport";
  case FailureKind::Protocol:
    return "protocol";
  case FailureKind::Agent:
    return "agent";
  case FailureKind::Provisioning:
    return "provisioning";
  }
  return "unknown";
}

class AgentFailure : public std::runtime_error {
public:
  AgentFailure(FailureKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  FailureKind kind() const noexcept { return kind_; }

private:
  FailureKind kind_;
};

class TransportError : public AgentFailure {
public:
  explicit TransportError(const std::string &what)
      : AgentFailure(FailureKind::Transport, what) {}
};

class ProtocolError : public AgentFailure {
public:
  explicit ProtocolError(const std::string &what)
      : AgentFailure(FailureKind::Protocol, what) {}
};

class AgentError : public AgentFailure {
public:
  explicit AgentError(const std::string &what, bool from_agent_log = false)
      : AgentFailure(FailureKind::Agent, what),
        from_agent_log_(from_agent_log) {}

  // True when the reason is an Error log the observer has already seen.
  bool from_agent_log() const noexcept { return from_agent_log_; }

private:
  bool from_agent_log_;
};

class ProvisioningError : public AgentFailure {
public:
  explicit ProvisioningError(const std::string &what)
      : AgentFailure(FailureKind::Provisioning, what) {}
};

} // namespace mbf_link
