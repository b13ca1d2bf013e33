#pragma once

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device/device_transport.hpp"

namespace mbf_device {

/**
 * @brief A child process on this machine with piped stdin/stdout/stderr.
 *
 * The child runs in its own process group so kill() also reaches anything it
 * started. stderr is drained on a background thread into memory, so a child
 * that writes a lot of diagnostics cannot stall on a full pipe.
 *
 * Threading: read_stdout() and wait_exit() may run on a different thread than
 * write_stdin()/kill(); each method itself has a single caller at a time.
 */
class LocalProcess : public AgentProcess {
public:
  // Starts argv[0] (looked up in PATH) with the given arguments.
  // Returns nullptr and sets err if the pipes, fork or exec fail.
  static std::unique_ptr<LocalProcess>
  start(const std::vector<std::string> &argv, std::string &err);

  ~LocalProcess() override;

  LocalProcess(const LocalProcess &) = delete;
  LocalProcess &operator=(const LocalProcess &) = delete;

  bool write_stdin(const std::string &data, std::string &err) override;
  void close_stdin() override;
  bool read_stdout(std::string &chunk) override;
  int wait_exit() override;
  std::string read_stderr() override;
  void kill() override;

  pid_t pid() const { return pid_; }

  // Convenience for one-shot commands: feeds input, collects stdout, stderr
  // and the exit code. Returns false (err set) if the process cannot start.
  static bool run(const std::vector<std::string> &argv,
                  const std::string &input, CommandResult &result,
                  std::string &err);

private:
  LocalProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);

  void drain_stderr();

  pid_t pid_;
  int stdin_fd_;
  int stdout_fd_;
  int stderr_fd_;

  std::thread stderr_thread_;
  std::string stderr_buf_;

  std::mutex mutex_; // guards exited_/exit_code_ against kill()
  bool exited_ = false;
  int exit_code_ = -1;
};

} // namespace mbf_device
