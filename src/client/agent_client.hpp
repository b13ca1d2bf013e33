#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "core/agent_messages.hpp"
#include "core/log_sink.hpp"
#include "device/device_transport.hpp"

namespace mbf_provision {
class AgentProvisioner;
}

namespace mbf_client {

namespace pb = mbf::agent::v1;
using mbf_session::LogEventSink;

struct ClientOptions {
  std::string agent_path = "/data/local/tmp/mbf-agent";
  std::string uploads_dir = "/data/local/tmp/mbf-uploads";
  // Alternate core mod index, forwarded with every request that accepts it.
  std::optional<std::string> core_mod_override_url;
};

/**
 * @brief Typed operations on the agent, one session each.
 *
 * Every call provisions (when a provisioner is given), runs the agent once and
 * narrows its result to the payload the operation expects. Failures are
 * mbf_link::AgentFailure subclasses; an unexpected payload type is a
 * ProtocolError. Calls must not overlap.
 */
class AgentClient {
public:
  AgentClient(std::shared_ptr<mbf_device::DeviceTransport> device,
              mbf_provision::AgentProvisioner *provisioner,
              ClientOptions options, LogEventSink sink);

  // Whether the app is patched and which mods are installed.
  pb::ModStatus load_mod_status();

  // Installs (true) or uninstalls (false) mods by id.
  pb::Mods set_mod_statuses(const std::map<std::string, bool> &changes);

  pb::Mods remove_mod(const std::string &id);

  // AndroidManifest.xml of the given game version, as XML text.
  std::string get_downgraded_manifest(const std::string &version);

  // Uploads a local file to the uploads directory, then imports it.
  pb::ImportResult import_file(const std::filesystem::path &local_path);

  pb::ImportResult import_url(const std::string &url);

  // Patches the app and returns the status assumed afterwards.
  pb::ModStatus patch_app(const pb::ModStatus &before,
                          const std::optional<std::string> &downgrade_to,
                          const std::string &manifest_mod, bool remodding,
                          bool allow_no_core_mods);

  // Reinstalls missing core mods and the modloader.
  pb::ModStatus quick_fix(const pb::ModStatus &before, bool wipe_existing_mods);

  // Returns whether a player data file existed.
  bool fix_player_data();

  // Provisioning only; returns true if the agent was (re)installed.
  bool prepare_agent();

private:
  mbf_session::TerminalResult run(const mbf_session::Request &request);

  template <typename T>
  T expect(const mbf_session::Request &request);

  std::shared_ptr<mbf_device::DeviceTransport> device_;
  mbf_provision::AgentProvisioner *provisioner_;
  ClientOptions options_;
  LogEventSink sink_;
};

} // namespace mbf_client
