#include "agent_client.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <variant>

#include "core/session.hpp"
#include "device/adb_transport.hpp"
#include "errors.hpp"
#include "provisioning/agent_provisioner.hpp"

namespace mbf_client {

using mbf_link::ProtocolError;
using mbf_session::Request;
using mbf_session::TerminalResult;

AgentClient::AgentClient(std::shared_ptr<mbf_device::DeviceTransport> device,
                         mbf_provision::AgentProvisioner *provisioner,
                         ClientOptions options, LogEventSink sink)
    : device_(std::move(device)), provisioner_(provisioner),
      options_(std::move(options)), sink_(std::move(sink)) {}

TerminalResult AgentClient::run(const Request &request) {
  mbf_session::Session session(device_, provisioner_, options_.agent_path,
                               sink_);
  return session.run(request);
}

template <typename T>
T AgentClient::expect(const Request &request) {
  TerminalResult result = run(request);
  if (auto *payload = std::get_if<T>(&result)) {
    return std::move(*payload);
  }
  throw ProtocolError("Agent answered " + mbf_session::type_name(request) +
                      " with " + mbf_session::type_name(result) +
                      " instead of " + T::descriptor()->name());
}

pb::ModStatus AgentClient::load_mod_status() {
  pb::GetModStatus req;
  if (options_.core_mod_override_url) {
    req.set_override_core_mod_url(*options_.core_mod_override_url);
  }
  return expect<pb::ModStatus>(req);
}

pb::Mods AgentClient::set_mod_statuses(const std::map<std::string, bool> &changes) {
  pb::SetModsEnabled req;
  for (const auto &[id, enabled] : changes) {
    (*req.mutable_statuses())[id] = enabled;
  }
  return expect<pb::Mods>(req);
}

pb::Mods AgentClient::remove_mod(const std::string &id) {
  pb::RemoveMod req;
  req.set_id(id);
  return expect<pb::Mods>(req);
}

std::string AgentClient::get_downgraded_manifest(const std::string &version) {
  pb::GetDowngradedManifest req;
  req.set_version(version);
  return expect<pb::DowngradedManifest>(req).manifest_xml();
}

pb::ImportResult AgentClient::import_file(const std::filesystem::path &local_path) {
  std::ifstream in(local_path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot open " + local_path.string());
  }
  const std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                                  std::istreambuf_iterator<char>());

  const std::string remote_path =
      options_.uploads_dir + "/" + local_path.filename().string();
  std::cerr << "[Client] uploading " << local_path << " to " << remote_path
            << "\n";

  const auto made = device_->run_command(
      "mkdir -p " + mbf_device::shell_quote(options_.uploads_dir));
  if (made.exit_code != 0) {
    throw mbf_link::TransportError("Failed to create " + options_.uploads_dir +
                                   " on device: " + made.err);
  }
  mbf_device::CancelFlag never{false};
  device_->write_file(remote_path, data, never);

  pb::Import req;
  req.set_from_path(remote_path);
  return expect<pb::ImportResult>(req);
}

pb::ImportResult AgentClient::import_url(const std::string &url) {
  pb::ImportUrl req;
  req.set_from_url(url);
  return expect<pb::ImportResult>(req);
}

pb::ModStatus AgentClient::patch_app(const pb::ModStatus &before,
                                     const std::optional<std::string> &downgrade_to,
                                     const std::string &manifest_mod,
                                     bool remodding, bool allow_no_core_mods) {
  pb::Patch req;
  if (downgrade_to) {
    req.set_downgrade_to(*downgrade_to);
  }
  req.set_manifest_mod(manifest_mod);
  req.set_allow_no_core_mods(allow_no_core_mods);
  if (options_.core_mod_override_url) {
    req.set_override_core_mod_url(*options_.core_mod_override_url);
  }
  req.set_remodding(remodding);

  const pb::Patched patched = expect<pb::Patched>(req);
  if (patched.did_remove_dlc()) {
    mbf_session::log_event(
        sink_, pb::LogMsg::Warn,
        "Installed DLC was (temporarily) deleted while downgrading the game. "
        "To get it back, FIRST restart your headset THEN download the DLC "
        "in-game.");
  }

  // Patching fails on the agent side if any of this does not hold.
  pb::ModStatus after;
  after.set_type(pb::ModStatus::descriptor()->name());
  pb::AppInfo *app = after.mutable_app_info();
  app->set_loader_installed("Scotland2");
  app->set_version(downgrade_to ? *downgrade_to : before.app_info().version());
  app->set_manifest_xml(manifest_mod);

  pb::CoreModsInfo *core = after.mutable_core_mods();
  core->set_all_core_mods_installed(true);
  *core->mutable_supported_versions() = before.core_mods().supported_versions();

  after.set_modloader_present(true);
  *after.mutable_installed_mods() = patched.installed_mods();
  return after;
}

pb::ModStatus AgentClient::quick_fix(const pb::ModStatus &before,
                                     bool wipe_existing_mods) {
  pb::QuickFix req;
  if (options_.core_mod_override_url) {
    req.set_override_core_mod_url(*options_.core_mod_override_url);
  }
  req.set_wipe_existing_mods(wipe_existing_mods);

  const pb::Mods mods = expect<pb::Mods>(req);

  pb::ModStatus after;
  after.set_type(pb::ModStatus::descriptor()->name());
  if (before.has_app_info()) {
    *after.mutable_app_info() = before.app_info();
  }
  pb::CoreModsInfo *core = after.mutable_core_mods();
  core->set_all_core_mods_installed(true);
  *core->mutable_supported_versions() = before.core_mods().supported_versions();
  *core->mutable_downgrade_versions() = before.core_mods().downgrade_versions();
  after.set_modloader_present(true);
  *after.mutable_installed_mods() = mods.installed_mods();
  return after;
}

bool AgentClient::fix_player_data() {
  return expect<pb::FixedPlayerData>(pb::FixPlayerData()).existed();
}

bool AgentClient::prepare_agent() {
  if (provisioner_ == nullptr) {
    return false;
  }
  return provisioner_->prepare(sink_);
}

} // namespace mbf_client
