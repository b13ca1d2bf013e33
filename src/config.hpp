#pragma once

#include <optional>
#include <string>

namespace mbf_link {

// Which device to talk to and how.
struct DeviceConfig {
  std::optional<std::string> serial; // adb -s; any single device if unset
  std::string adb_path = "adb";
};

// Where the agent comes from and where it lives on the device.
struct AgentConfig {
  std::string remote_path = "/data/local/tmp/mbf-agent";
  std::string url;
  std::string sha1;                     // expected content hash, 40 hex digits
  std::optional<std::string> cache_dir; // local copy of the agent
};

// Complete link configuration. Built once before the first session and
// treated as read-only afterwards.
struct LinkConfig {
  std::string config_file_path; // empty for the built-in defaults
  DeviceConfig device;
  AgentConfig agent;
  std::string uploads_dir = "/data/local/tmp/mbf-uploads";
  std::optional<std::string> core_mod_override_url;
};

// Built-in defaults; the agent URL and SHA1 come from the build.
LinkConfig default_config();

// Load configuration from YAML file, on top of default_config().
// Throws std::runtime_error if file cannot be read, parsed, or validated
LinkConfig load_config(const std::string &path);

// Checks cross-field constraints (agent URL present, SHA1 well formed).
// Throws std::runtime_error with a [CONFIG] message.
void validate_config(const LinkConfig &config);

} // namespace mbf_link
