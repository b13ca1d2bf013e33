#include "session.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "core/event_channel.hpp"
#include "core/transport/line_framed.hpp"
#include "errors.hpp"
#include "provisioning/agent_provisioner.hpp"

namespace mbf_session {

using mbf_link::AgentError;
using mbf_link::AgentFailure;
using mbf_link::ProtocolError;
using mbf_link::TransportError;

namespace {

// Stops the agent (if still running) and joins the stdout reader when the
// streaming phase ends, however it ends.
struct StreamGuard {
  mbf_device::DeviceTransport &device;
  mbf_device::AgentProcess &process;
  std::thread &reader;
  int subscription;

  ~StreamGuard() {
    device.unsubscribe_disconnect(subscription);
    if (reader.joinable()) {
      process.kill();
      reader.join();
    }
  }
};

} // namespace

const char *to_string(SessionState state) {
  switch (state) {
  case SessionState::Provisioning:
    return "provisioning";
  case SessionState::Spawning:
    return "spawning";
  case SessionState::Sending:
    return "sending";
  case SessionState::Streaming:
    return "streaming";
  case SessionState::Resolved:
    return "resolved";
  }
  return "unknown";
}

TerminalResult resolve_outcome(int exit_code,
                               const std::optional<Latched> &latched,
                               const std::string &stderr_text) {
  if (exit_code != 0) {
    // The agent could not even write a structured response; it may be
    // corrupt or built for the wrong architecture.
    throw ProtocolError("Failed to invoke agent (exit code " +
                        std::to_string(exit_code) +
                        "): is the executable corrupt?\n" + stderr_text);
  }

  if (!latched) {
    throw AgentError("Received no response from agent");
  }

  if (const auto *log = std::get_if<pb::LogMsg>(&*latched)) {
    throw AgentError(log->message(), true);
  }
  return std::get<TerminalResult>(*latched);
}

Session::Session(std::shared_ptr<mbf_device::DeviceTransport> device,
                 mbf_provision::AgentProvisioner *provisioner,
                 std::string agent_path, LogEventSink sink)
    : device_(std::move(device)), provisioner_(provisioner),
      agent_path_(std::move(agent_path)), sink_(std::move(sink)) {}

TerminalResult Session::run(const Request &request) {
  if (used_) {
    throw std::logic_error("Session::run called twice");
  }
  used_ = true;

  try {
    TerminalResult result = run_phases(request);
    state_ = SessionState::Resolved;
    return result;
  } catch (const AgentError &e) {
    state_ = SessionState::Resolved;
    if (!e.from_agent_log()) {
      log_event(sink_, pb::LogMsg::Error, e.what());
    }
    throw;
  } catch (const AgentFailure &e) {
    std::cerr << "[Session] " << mbf_link::to_string(e.kind())
              << " failure while " << to_string(state_) << "\n";
    state_ = SessionState::Resolved;
    log_event(sink_, pb::LogMsg::Error, e.what());
    throw;
  }
}

void Session::send_request(mbf_device::AgentProcess &process,
                           const Request &request) {
  std::string frame;
  std::string err;
  if (!transport::encode_frame(encode_request(request), frame, err)) {
    throw ProtocolError("Cannot frame " + type_name(request) + ": " + err);
  }

  if (!process.write_stdin(frame, err)) {
    if (err != "EPIPE") {
      throw TransportError("Failed to send request to agent: " + err);
    }
    // Agent is already gone; its exit status and stderr tell why.
    std::cerr << "[Session] agent closed stdin before reading the request\n";
  }
  process.close_stdin();
}

TerminalResult Session::run_phases(const Request &request) {
  state_ = SessionState::Provisioning;
  if (provisioner_ != nullptr) {
    provisioner_->prepare(sink_);
  }

  state_ = SessionState::Spawning;
  std::unique_ptr<mbf_device::AgentProcess> process = device_->spawn(agent_path_);

  state_ = SessionState::Sending;
  send_request(*process, request);

  state_ = SessionState::Streaming;
  auto events = std::make_shared<EventChannel>();

  const int subscription = device_->subscribe_disconnect(
      [events]() { events->push(DeviceDisconnected{}); });

  mbf_device::AgentProcess *proc = process.get();
  std::thread reader([events, proc]() {
    std::string chunk;
    while (proc->read_stdout(chunk)) {
      events->push(StdoutChunk{chunk});
    }
    events->push(StdoutClosed{});
    events->push(ProcessExited{proc->wait_exit()});
  });

  StreamGuard guard{*device_, *process, reader, subscription};

  transport::LineFramer framer;
  Demultiplexer demux(sink_);
  std::vector<std::string> frames;
  std::string err;

  bool exited = false;
  bool disconnected = false;
  int exit_code = -1;

  while (!exited && !disconnected) {
    SessionEvent event = events->wait();

    if (auto *chunk = std::get_if<StdoutChunk>(&event)) {
      frames.clear();
      if (!framer.feed(chunk->data, frames, err)) {
        throw ProtocolError("Agent output could not be framed: " + err);
      }
      for (const auto &frame : frames) {
        demux.dispatch(decode_message(frame));
      }
    } else if (std::holds_alternative<StdoutClosed>(event)) {
      if (!framer.pending().empty()) {
        std::cerr << "[Session] discarding " << framer.pending().size()
                  << " bytes of agent output after the last newline\n";
      }
    } else if (auto *status = std::get_if<ProcessExited>(&event)) {
      exited = true;
      exit_code = status->exit_code;
    } else {
      disconnected = true;
    }
  }

  if (!exited) {
    throw TransportError("Device disconnected while the agent was running " +
                         type_name(request));
  }

  std::string stderr_text;
  if (exit_code != 0) {
    // Leftover children must not keep the stderr drain waiting.
    process->kill();
    stderr_text = process->read_stderr();
  }
  return resolve_outcome(exit_code, demux.latched(), stderr_text);
}

} // namespace mbf_session
