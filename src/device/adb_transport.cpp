#include "adb_transport.hpp"

#include <chrono>
#include <csignal>
#include <condition_variable>
#include <iostream>

#include "errors.hpp"

namespace mbf_device {

using mbf_link::TransportError;

namespace {

// How often a blocked file transfer re-checks its cancel flag.
constexpr std::chrono::milliseconds kCancelCheckInterval{100};

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  const auto first = s.find_first_not_of(ws);
  if (first == std::string::npos) {
    return "";
  }
  const auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

} // namespace

std::string shell_quote(const std::string &s) {
  std::string out = "'";
  for (const char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

AdbTransport::AdbTransport(std::string adb_path,
                           std::optional<std::string> serial)
    : adb_path_(std::move(adb_path)), serial_(std::move(serial)) {}

AdbTransport::~AdbTransport() {
  if (watcher_process_) {
    watcher_process_->kill();
  }
  if (watcher_thread_.joinable()) {
    watcher_thread_.join();
  }
}

std::vector<std::string>
AdbTransport::adb_args(std::vector<std::string> rest) const {
  std::vector<std::string> argv{adb_path_};
  if (serial_) {
    argv.push_back("-s");
    argv.push_back(*serial_);
  }
  for (auto &r : rest) {
    argv.push_back(std::move(r));
  }
  return argv;
}

std::unique_ptr<AgentProcess> AdbTransport::spawn(const std::string &path) {
  std::string err;
  auto proc = LocalProcess::start(adb_args({"shell", "-T", shell_quote(path)}),
                                  err);
  if (!proc) {
    throw TransportError("Failed to start agent " + path + ": " + err);
  }
  return proc;
}

CommandResult AdbTransport::run_command(const std::string &cmd) {
  CommandResult result;
  std::string err;
  if (!LocalProcess::run(adb_args({"shell", cmd}), "", result, err)) {
    throw TransportError("Failed to run '" + cmd + "' on device: " + err);
  }
  return result;
}

void AdbTransport::run_checked(const std::string &cmd,
                               const std::string &what) {
  const CommandResult result = run_command(cmd);
  if (result.exit_code != 0) {
    std::string detail = trim(result.err);
    if (detail.empty()) {
      detail = trim(result.out);
    }
    throw TransportError("Failed to " + what + " (exit " +
                         std::to_string(result.exit_code) + "): " + detail);
  }
}

void AdbTransport::write_file(const std::string &path,
                              const std::vector<uint8_t> &data,
                              const CancelFlag &cancel) {
  std::string err;
  auto proc =
      LocalProcess::start(adb_args({"exec-in", "cat > " + shell_quote(path)}),
                          err);
  if (!proc) {
    throw TransportError("Failed to start upload of " + path + ": " + err);
  }

  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  std::string write_err;

  std::thread writer([&]() {
    std::string e;
    proc->write_stdin(
        std::string(reinterpret_cast<const char *>(data.data()), data.size()),
        e);
    proc->close_stdin();
    {
      std::lock_guard<std::mutex> lock(mutex);
      write_err = e;
      done = true;
    }
    cv.notify_all();
  });

  {
    std::unique_lock<std::mutex> lock(mutex);
    while (!cv.wait_for(lock, kCancelCheckInterval, [&] { return done; })) {
      if (cancel.load()) {
        // The writer sees EPIPE once the process group is gone.
        proc->kill();
      }
    }
  }
  writer.join();

  std::string chunk;
  while (proc->read_stdout(chunk)) {
  }
  const int code = proc->wait_exit();

  if (cancel.load()) {
    throw TransportError("Upload of " + path + " was cancelled");
  }
  if (!write_err.empty() || code != 0) {
    proc->kill();
    std::string detail = trim(proc->read_stderr());
    if (detail.empty()) {
      detail = write_err;
    }
    throw TransportError("Failed to write " + path + " (exit " +
                         std::to_string(code) + "): " + detail);
  }
}

void AdbTransport::remove_file(const std::string &path) {
  run_checked("rm -f " + shell_quote(path), "remove " + path);
}

void AdbTransport::make_executable(const std::string &path) {
  run_checked("chmod +x " + shell_quote(path), "make " + path + " executable");
}

int AdbTransport::subscribe_disconnect(DisconnectListener listener) {
  bool already_gone = false;
  int id = 0;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    id = next_listener_id_++;
    if (disconnected_) {
      already_gone = true;
    } else {
      listeners_[id] = std::move(listener);
      start_watcher_locked();
    }
  }

  if (already_gone) {
    listener();
  }
  return id;
}

void AdbTransport::unsubscribe_disconnect(int id) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.erase(id);
}

void AdbTransport::start_watcher_locked() {
  if (watcher_process_) {
    return;
  }

  std::string err;
  watcher_process_ = LocalProcess::start(adb_args({"wait-for-disconnect"}), err);
  if (!watcher_process_) {
    std::cerr << "[AdbTransport] cannot watch for disconnects: " << err
              << "\n";
    return;
  }
  watcher_thread_ = std::thread(&AdbTransport::watch_disconnect, this);
}

void AdbTransport::watch_disconnect() {
  std::string chunk;
  while (watcher_process_->read_stdout(chunk)) {
  }
  const int code = watcher_process_->wait_exit();
  if (code != 0) {
    // Killed by our destructor, or adb could not watch at all.
    if (code != 128 + SIGKILL) {
      watcher_process_->kill();
      std::cerr << "[AdbTransport] disconnect watcher exited with " << code
                << ": " << trim(watcher_process_->read_stderr()) << "\n";
    }
    return;
  }

  std::map<int, DisconnectListener> to_notify;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    disconnected_ = true;
    to_notify.swap(listeners_);
  }

  std::cerr << "[AdbTransport] device disconnected\n";
  for (auto &[id, listener] : to_notify) {
    (void)id;
    listener();
  }
}

} // namespace mbf_device
