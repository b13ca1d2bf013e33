#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <stdexcept>

#include "provisioning/sha1.hpp"

#ifndef MBF_LINK_AGENT_SHA1
#define MBF_LINK_AGENT_SHA1 ""
#endif

#ifndef MBF_LINK_AGENT_URL
#define MBF_LINK_AGENT_URL ""
#endif

namespace mbf_link {

namespace fs = std::filesystem;

namespace {

std::string read_string(const YAML::Node &node, const std::string &key) {
  try {
    const std::string value = node.as<std::string>();
    if (value.empty()) {
      throw std::runtime_error("[CONFIG] '" + key + "' must not be empty");
    }
    return value;
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid '" + key + "': " + e.what());
  }
}

void require_map(const YAML::Node &node, const std::string &key) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] '" + key + "' section must be a map");
  }
}

} // namespace

LinkConfig default_config() {
  LinkConfig config;
  config.agent.url = MBF_LINK_AGENT_URL;
  config.agent.sha1 = MBF_LINK_AGENT_SHA1;
  return config;
}

void validate_config(const LinkConfig &config) {
  if (config.agent.url.empty()) {
    throw std::runtime_error(
        "[CONFIG] Missing 'agent.url' and no default was built in");
  }
  if (!mbf_provision::is_sha1_hex(config.agent.sha1)) {
    throw std::runtime_error("[CONFIG] 'agent.sha1' must be 40 hex digits, got '" +
                             config.agent.sha1 + "'");
  }
  if (config.agent.remote_path.empty() || config.agent.remote_path[0] != '/') {
    throw std::runtime_error(
        "[CONFIG] 'agent.remote_path' must be an absolute device path");
  }
  if (config.uploads_dir.empty() || config.uploads_dir[0] != '/') {
    throw std::runtime_error(
        "[CONFIG] 'uploads_dir' must be an absolute device path");
  }
}

LinkConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  LinkConfig config = default_config();
  config.config_file_path = fs::absolute(path).string();

  if (!yaml || yaml.IsNull()) {
    validate_config(config);
    return config;
  }
  require_map(yaml, "root");

  for (const auto &kv : yaml) {
    const std::string key = kv.first.as<std::string>();
    if (key != "device" && key != "agent" && key != "uploads_dir" &&
        key != "core_mod_override_url") {
      throw std::runtime_error("[CONFIG] Unknown top-level key '" + key + "'");
    }
  }

  if (const YAML::Node device = yaml["device"]) {
    require_map(device, "device");
    if (device["serial"]) {
      config.device.serial = read_string(device["serial"], "device.serial");
    }
    if (device["adb_path"]) {
      config.device.adb_path = read_string(device["adb_path"], "device.adb_path");
    }
  }

  if (const YAML::Node agent = yaml["agent"]) {
    require_map(agent, "agent");
    if (agent["remote_path"]) {
      config.agent.remote_path =
          read_string(agent["remote_path"], "agent.remote_path");
    }
    if (agent["url"]) {
      config.agent.url = read_string(agent["url"], "agent.url");
    }
    if (agent["sha1"]) {
      config.agent.sha1 = read_string(agent["sha1"], "agent.sha1");
    }
    if (agent["cache_dir"]) {
      // Relative cache directories are resolved against the config file.
      fs::path dir = read_string(agent["cache_dir"], "agent.cache_dir");
      if (dir.is_relative()) {
        dir = fs::path(config.config_file_path).parent_path() / dir;
      }
      config.agent.cache_dir = dir.lexically_normal().string();
    }
  }

  if (yaml["uploads_dir"]) {
    config.uploads_dir = read_string(yaml["uploads_dir"], "uploads_dir");
  }

  if (yaml["core_mod_override_url"]) {
    config.core_mod_override_url =
        read_string(yaml["core_mod_override_url"], "core_mod_override_url");
  }

  validate_config(config);
  return config;
}

} // namespace mbf_link
