#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mbf_device {

using CancelFlag = std::atomic<bool>;

struct CommandResult {
  int exit_code = -1;
  std::string out;
  std::string err;
};

// A process running on the device with its stdio attached to this side.
// stdout and stderr each have exactly one reader.
class AgentProcess {
public:
  virtual ~AgentProcess() = default;

  // Writes all of data to the process's stdin.
  // Returns false (err set) on failure; err is "EPIPE" if the reader is gone.
  virtual bool write_stdin(const std::string &data, std::string &err) = 0;

  // Releases stdin; the process sees end of input.
  virtual void close_stdin() = 0;

  // Blocks for the next chunk of stdout. Returns false at end of stream.
  virtual bool read_stdout(std::string &chunk) = 0;

  // Blocks until the process has exited and returns its exit code
  // (128 + signal number if it was killed).
  virtual int wait_exit() = 0;

  // Everything the process wrote to stderr. Only complete after exit.
  virtual std::string read_stderr() = 0;

  // Terminates the process if it is still running, along with anything it
  // started that is still around.
  virtual void kill() = 0;
};

// Everything the control side needs from a connected device.
class DeviceTransport {
public:
  using DisconnectListener = std::function<void()>;

  virtual ~DeviceTransport() = default;

  // Throws mbf_link::TransportError if the process cannot be started.
  virtual std::unique_ptr<AgentProcess> spawn(const std::string &path) = 0;

  // Runs a shell command on the device and captures its output.
  // A non-zero exit is reported in the result, not thrown.
  virtual CommandResult run_command(const std::string &cmd) = 0;

  // Writes data to path, replacing any existing file. Implementations stop
  // early once cancel is raised. Throws mbf_link::TransportError on failure.
  virtual void write_file(const std::string &path,
                          const std::vector<uint8_t> &data,
                          const CancelFlag &cancel) = 0;

  // Removes path; a missing file is not an error.
  virtual void remove_file(const std::string &path) = 0;

  virtual void make_executable(const std::string &path) = 0;

  // Listener runs once, on an arbitrary thread, when the device goes away
  // (immediately if it is already gone). Returns an id for unsubscribe.
  virtual int subscribe_disconnect(DisconnectListener listener) = 0;
  virtual void unsubscribe_disconnect(int id) = 0;
};

} // namespace mbf_device
