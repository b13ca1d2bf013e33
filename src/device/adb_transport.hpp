#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "device/device_transport.hpp"
#include "device/local_process.hpp"

namespace mbf_device {

// Wraps s in single quotes for the device shell.
std::string shell_quote(const std::string &s);

/**
 * @brief DeviceTransport backed by the `adb` command-line tool.
 *
 * Every operation is one adb invocation. A background `adb wait-for-disconnect`
 * process provides the disconnect signal; it is started on the first
 * subscription and killed when the transport is destroyed.
 */
class AdbTransport : public DeviceTransport {
public:
  AdbTransport(std::string adb_path, std::optional<std::string> serial);
  ~AdbTransport() override;

  AdbTransport(const AdbTransport &) = delete;
  AdbTransport &operator=(const AdbTransport &) = delete;

  std::unique_ptr<AgentProcess> spawn(const std::string &path) override;
  CommandResult run_command(const std::string &cmd) override;
  void write_file(const std::string &path, const std::vector<uint8_t> &data,
                  const CancelFlag &cancel) override;
  void remove_file(const std::string &path) override;
  void make_executable(const std::string &path) override;

  int subscribe_disconnect(DisconnectListener listener) override;
  void unsubscribe_disconnect(int id) override;

private:
  std::vector<std::string> adb_args(std::vector<std::string> rest) const;
  void run_checked(const std::string &cmd, const std::string &what);
  void start_watcher_locked();
  void watch_disconnect();

  std::string adb_path_;
  std::optional<std::string> serial_;

  std::mutex listeners_mutex_;
  std::map<int, DisconnectListener> listeners_;
  int next_listener_id_ = 1;
  bool disconnected_ = false;

  std::unique_ptr<LocalProcess> watcher_process_;
  std::thread watcher_thread_;
};

} // namespace mbf_device
