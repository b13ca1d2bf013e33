#pragma once

#include <cctype>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "device/device_transport.hpp"
#include "device/local_process.hpp"
#include "errors.hpp"
#include "provisioning/sha1.hpp"

namespace mbf_test {

using mbf_device::CommandResult;

/**
 * In-memory device. Files live in a map, `sha1sum` is answered from it in
 * lowercase like the real tool, and spawn() runs `agent_script` with
 * /bin/sh on this machine so the agent's stdio goes through real pipes.
 */
class FakeDevice : public mbf_device::DeviceTransport {
public:
  std::string agent_script = "exit 0";
  std::chrono::milliseconds write_delay{0};
  bool fail_writes = false;

  std::unique_ptr<mbf_device::AgentProcess>
  spawn(const std::string &path) override {
    record("spawn " + path);
    std::string err;
    auto proc =
        mbf_device::LocalProcess::start({"/bin/sh", "-c", agent_script}, err);
    if (!proc) {
      throw mbf_link::TransportError(err);
    }
    return proc;
  }

  CommandResult run_command(const std::string &cmd) override {
    record("run " + cmd);
    CommandResult result;
    result.exit_code = 0;

    const std::string prefix = "sha1sum '";
    if (cmd.rfind(prefix, 0) == 0) {
      const std::string path =
          cmd.substr(prefix.size(), cmd.find('\'', prefix.size()) - prefix.size());
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = files_.find(path);
      if (it != files_.end()) {
        std::string hex = mbf_provision::sha1_hex(it->second);
        for (auto &c : hex) {
          c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        result.out = hex + "\n";
      } else {
        result.out = "\n";
        result.err = "sha1sum: " + path + ": No such file or directory\n";
      }
    }
    return result;
  }

  void write_file(const std::string &path, const std::vector<uint8_t> &data,
                  const mbf_device::CancelFlag &cancel) override {
    record("write " + path);
    const auto deadline = std::chrono::steady_clock::now() + write_delay;
    while (std::chrono::steady_clock::now() < deadline) {
      if (cancel.load()) {
        throw mbf_link::TransportError("write cancelled");
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (fail_writes) {
      throw mbf_link::TransportError("No space left on device");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = data;
  }

  void remove_file(const std::string &path) override {
    record("remove " + path);
    std::lock_guard<std::mutex> lock(mutex_);
    files_.erase(path);
  }

  void make_executable(const std::string &path) override {
    record("chmod " + path);
  }

  int subscribe_disconnect(DisconnectListener listener) override {
    int id = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      id = next_id_++;
      if (!disconnected_) {
        listeners_[id] = std::move(listener);
        return id;
      }
    }
    listener();
    return id;
  }

  void unsubscribe_disconnect(int id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(id);
  }

  void disconnect() {
    std::map<int, DisconnectListener> to_notify;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      disconnected_ = true;
      to_notify.swap(listeners_);
    }
    for (auto &entry : to_notify) {
      entry.second();
    }
  }

  void put_file(const std::string &path, const std::vector<uint8_t> &data) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[path] = data;
  }

  bool has_file(const std::string &path) {
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.count(path) != 0;
  }

  std::vector<std::string> operations() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ops_;
  }

  size_t listener_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
  }

private:
  void record(const std::string &op) {
    std::lock_guard<std::mutex> lock(mutex_);
    ops_.push_back(op);
  }

  std::mutex mutex_;
  std::map<std::string, std::vector<uint8_t>> files_;
  std::vector<std::string> ops_;
  std::map<int, DisconnectListener> listeners_;
  int next_id_ = 1;
  bool disconnected_ = false;
};

inline std::vector<uint8_t> bytes(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace mbf_test
