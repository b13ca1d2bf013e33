#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "core/log_sink.hpp"
#include "device/device_transport.hpp"
#include "provisioning/fetcher.hpp"

namespace mbf_provision {

struct ProvisioningOptions {
  std::string remote_path;
  std::string expected_sha1; // 40 hex digits, either case
  std::chrono::milliseconds upload_timeout{30000};
};

/**
 * @brief Makes sure the device holds the expected agent executable.
 *
 * prepare() hashes the installed file on the device and does nothing when it
 * matches; otherwise it reinstalls: remove, fetch, verify, upload, chmod,
 * verify again. Every step is reported to the sink. Any failure propagates;
 * the device may then hold a partial file, which the next prepare() replaces.
 */
class AgentProvisioner {
public:
  // Throws mbf_link::ProvisioningError if expected_sha1 is not a SHA1 digest.
  AgentProvisioner(std::shared_ptr<mbf_device::DeviceTransport> device,
                   AgentBinarySource &source, ProvisioningOptions options);

  // Returns true when the agent had to be (re)installed.
  bool prepare(const LogEventSink &sink);

  // Unconditional reinstall.
  void overwrite(const LogEventSink &sink);

  // Uppercase SHA1 of the installed agent, empty if there is none.
  std::string remote_sha1();

  const ProvisioningOptions &options() const { return options_; }

private:
  void upload(const std::vector<uint8_t> &data);

  std::shared_ptr<mbf_device::DeviceTransport> device_;
  AgentBinarySource &source_;
  ProvisioningOptions options_;
};

} // namespace mbf_provision
