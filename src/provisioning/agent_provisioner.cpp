#include "agent_provisioner.hpp"

#include <cctype>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>

#include "device/adb_transport.hpp"
#include "errors.hpp"
#include "provisioning/sha1.hpp"

namespace mbf_provision {

using mbf_link::ProvisioningError;
using mbf_session::log_info;

namespace {

// Shared between provisioning and a write that may outlive it.
struct UploadState {
  std::mutex mutex;
  std::condition_variable cv;
  bool done = false;
  std::exception_ptr error;
  mbf_device::CancelFlag cancel{false};
};

std::string trim_upper(const std::string &s) {
  std::string out;
  for (const unsigned char c : s) {
    if (!std::isspace(c)) {
      out += static_cast<char>(std::toupper(c));
    }
  }
  return out;
}

std::string describe(std::chrono::milliseconds timeout) {
  if (timeout.count() % 1000 == 0) {
    return std::to_string(timeout.count() / 1000) + " seconds";
  }
  return std::to_string(timeout.count()) + " milliseconds";
}

} // namespace

AgentProvisioner::AgentProvisioner(
    std::shared_ptr<mbf_device::DeviceTransport> device,
    AgentBinarySource &source, ProvisioningOptions options)
    : device_(std::move(device)), source_(source), options_(std::move(options)) {
  if (!is_sha1_hex(options_.expected_sha1)) {
    throw ProvisioningError("Expected agent SHA1 '" + options_.expected_sha1 +
                            "' is not a 40 digit hex string");
  }
  options_.expected_sha1 = trim_upper(options_.expected_sha1);
}

std::string AgentProvisioner::remote_sha1() {
  const auto result = device_->run_command(
      "sha1sum " + mbf_device::shell_quote(options_.remote_path) +
      " | cut -f 1 -d \" \"");
  return trim_upper(result.out);
}

bool AgentProvisioner::prepare(const LogEventSink &sink) {
  log_info(sink, "Preparing agent: used to communicate with your Quest.");

  const std::string existing = remote_sha1();
  std::cerr << "[Provision] expected agent SHA1 " << options_.expected_sha1
            << ", installed " << (existing.empty() ? "(none)" : existing)
            << "\n";

  if (same_digest(existing, options_.expected_sha1)) {
    log_info(sink, "Agent is up to date");
    return false;
  }

  overwrite(sink);
  return true;
}

void AgentProvisioner::overwrite(const LogEventSink &sink) {
  log_info(sink, "Removing existing agent");
  device_->remove_file(options_.remote_path);

  log_info(sink, "Downloading agent, this might take a minute if it's not cached");
  const std::vector<uint8_t> agent = source_.fetch(sink);

  const std::string downloaded = sha1_hex(agent);
  if (!same_digest(downloaded, options_.expected_sha1)) {
    throw ProvisioningError("Downloaded agent has SHA1 " + downloaded + " but " +
                            options_.expected_sha1 + " was expected");
  }

  log_info(sink, "Writing agent to device");
  upload(agent);

  log_info(sink, "Making agent executable");
  device_->make_executable(options_.remote_path);

  const std::string installed = remote_sha1();
  if (!same_digest(installed, options_.expected_sha1)) {
    throw ProvisioningError("Agent on device has SHA1 '" + installed +
                            "' after upload, expected " +
                            options_.expected_sha1);
  }
  log_info(sink, "Agent is ready");
}

void AgentProvisioner::upload(const std::vector<uint8_t> &data) {
  auto state = std::make_shared<UploadState>();
  auto bytes = std::make_shared<const std::vector<uint8_t>>(data);

  // The writer owns everything it touches, so on timeout it can be left to
  // finish (or notice the cancel flag) on its own.
  std::thread([device = device_, path = options_.remote_path, bytes, state]() {
    std::exception_ptr error;
    try {
      device->write_file(path, *bytes, state->cancel);
    } catch (const std::exception &e) {
      if (state->cancel.load()) {
        std::cerr << "[Provision] abandoned upload of " << path
                  << " ended: " << e.what() << "\n";
      }
      error = std::current_exception();
    }
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->error = error;
      state->done = true;
    }
    state->cv.notify_all();
  }).detach();

  std::unique_lock<std::mutex> lock(state->mutex);
  if (!state->cv.wait_for(lock, options_.upload_timeout,
                          [&state] { return state->done; })) {
    state->cancel.store(true);
    std::cerr << "[Provision] upload of " << options_.remote_path
              << " still running after " << describe(options_.upload_timeout)
              << ", abandoning it\n";
    throw ProvisioningError(
        "Did not finish pushing agent after " +
        describe(options_.upload_timeout) +
        ".\nIn practice, pushing the agent takes less than a second, so this "
        "is a bug. Please report this issue including your adb version and "
        "the log output.");
  }

  if (state->error) {
    std::rethrow_exception(state->error);
  }
}

} // namespace mbf_provision
