#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "client/agent_client.hpp"
#include "config.hpp"
#include "core/agent_messages.hpp"
#include "device/adb_transport.hpp"
#include "errors.hpp"
#include "provisioning/agent_cache.hpp"
#include "provisioning/agent_provisioner.hpp"
#include "provisioning/curl_http_client.hpp"
#include "provisioning/fetcher.hpp"

namespace {

namespace pb = mbf::agent::v1;

constexpr int kExitUsage = 1;

void log_err(const std::string &msg) { std::cerr << "mbf-link: " << msg << "\n"; }

void print_usage() {
  std::cerr
      << "Usage: mbf-link [--config FILE] [--serial SERIAL] [--core-mod-url URL]"
         " [--events] <command> [args]\n"
         "Commands:\n"
         "  prepare-agent\n"
         "  status\n"
         "  enable ID...\n"
         "  disable ID...\n"
         "  remove ID\n"
         "  import FILE\n"
         "  import-url URL\n"
         "  manifest VERSION\n"
         "  patch --manifest FILE [--downgrade-to VERSION] [--remodding]"
         " [--allow-no-core-mods]\n"
         "  quick-fix [--wipe]\n"
         "  fix-player-data\n";
}

int exit_code_for(mbf_link::FailureKind kind) {
  switch (kind) {
  case mbf_link::FailureKind::Transport:
    return 2;
  case mbf_link::FailureKind::Protocol:
    return 3;
  case mbf_link::FailureKind::Agent:
    return 4;
  case mbf_link::FailureKind::Provisioning:
    return 5;
  }
  return kExitUsage;
}

std::string read_text_file(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot open " + path);
  }
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

std::string json_bool(const char *key, bool value) {
  return std::string("{\"") + key + "\":" + (value ? "true" : "false") + "}";
}

struct CommandLine {
  std::optional<std::string> config_path;
  std::optional<std::string> serial;
  std::optional<std::string> core_mod_url;
  bool events = false;
  std::string command;
  std::vector<std::string> args;
};

// Returns false on a usage error.
bool parse_command_line(int argc, char **argv, CommandLine &cl) {
  int i = 1;
  for (; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      cl.config_path = argv[++i];
    } else if (arg == "--serial" && i + 1 < argc) {
      cl.serial = argv[++i];
    } else if (arg == "--core-mod-url" && i + 1 < argc) {
      cl.core_mod_url = argv[++i];
    } else if (arg == "--events") {
      cl.events = true;
    } else if (arg.rfind("--", 0) == 0) {
      log_err("unknown option " + arg);
      return false;
    } else {
      break;
    }
  }

  if (i >= argc) {
    return false;
  }
  cl.command = argv[i++];
  for (; i < argc; ++i) {
    cl.args.emplace_back(argv[i]);
  }
  return true;
}

// Runs one command; returns the process exit code.
int run_command(const CommandLine &cl, mbf_client::AgentClient &client) {
  const auto &args = cl.args;

  if (cl.command == "prepare-agent" && args.empty()) {
    std::cout << json_bool("installed", client.prepare_agent()) << "\n";
  } else if (cl.command == "status" && args.empty()) {
    std::cout << mbf_session::to_json(client.load_mod_status()) << "\n";
  } else if ((cl.command == "enable" || cl.command == "disable") &&
             !args.empty()) {
    std::map<std::string, bool> changes;
    for (const auto &id : args) {
      changes[id] = cl.command == "enable";
    }
    std::cout << mbf_session::to_json(client.set_mod_statuses(changes)) << "\n";
  } else if (cl.command == "remove" && args.size() == 1) {
    std::cout << mbf_session::to_json(client.remove_mod(args[0])) << "\n";
  } else if (cl.command == "import" && args.size() == 1) {
    std::cout << mbf_session::to_json(client.import_file(args[0])) << "\n";
  } else if (cl.command == "import-url" && args.size() == 1) {
    std::cout << mbf_session::to_json(client.import_url(args[0])) << "\n";
  } else if (cl.command == "manifest" && args.size() == 1) {
    std::cout << client.get_downgraded_manifest(args[0]);
  } else if (cl.command == "patch") {
    std::optional<std::string> manifest_path;
    std::optional<std::string> downgrade_to;
    bool remodding = false;
    bool allow_no_core_mods = false;
    for (size_t i = 0; i < args.size(); ++i) {
      if (args[i] == "--manifest" && i + 1 < args.size()) {
        manifest_path = args[++i];
      } else if (args[i] == "--downgrade-to" && i + 1 < args.size()) {
        downgrade_to = args[++i];
      } else if (args[i] == "--remodding") {
        remodding = true;
      } else if (args[i] == "--allow-no-core-mods") {
        allow_no_core_mods = true;
      } else {
        log_err("unexpected patch argument " + args[i]);
        return kExitUsage;
      }
    }
    if (!manifest_path) {
      log_err("patch requires --manifest FILE");
      return kExitUsage;
    }
    const std::string manifest = read_text_file(*manifest_path);
    const pb::ModStatus before = client.load_mod_status();
    std::cout << mbf_session::to_json(client.patch_app(
                     before, downgrade_to, manifest, remodding,
                     allow_no_core_mods))
              << "\n";
  } else if (cl.command == "quick-fix" &&
             (args.empty() || (args.size() == 1 && args[0] == "--wipe"))) {
    const pb::ModStatus before = client.load_mod_status();
    std::cout << mbf_session::to_json(client.quick_fix(before, !args.empty()))
              << "\n";
  } else if (cl.command == "fix-player-data" && args.empty()) {
    std::cout << json_bool("existed", client.fix_player_data()) << "\n";
  } else {
    log_err("bad command line for '" + cl.command + "'");
    print_usage();
    return kExitUsage;
  }
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  CommandLine cl;
  if (!parse_command_line(argc, argv, cl)) {
    print_usage();
    return kExitUsage;
  }

  mbf_link::LinkConfig config;
  try {
    if (cl.config_path) {
      log_err("loading configuration from: " + *cl.config_path);
      config = mbf_link::load_config(*cl.config_path);
    } else {
      config = mbf_link::default_config();
    }
    if (cl.serial) {
      config.device.serial = cl.serial;
    }
    if (cl.core_mod_url) {
      config.core_mod_override_url = cl.core_mod_url;
    }
    mbf_link::validate_config(config);
  } catch (const std::exception &e) {
    log_err("FATAL: " + std::string(e.what()));
    return kExitUsage;
  }

  mbf_session::LogEventSink sink;
  if (cl.events) {
    sink = [](const pb::LogMsg &log) {
      std::cout << mbf_session::to_json(log) << "\n" << std::flush;
    };
  }

  try {
    auto device = std::make_shared<mbf_device::AdbTransport>(
        config.device.adb_path, config.device.serial);

    mbf_provision::CurlHttpClient http;
    mbf_provision::ResilientFetcher fetcher(http, config.agent.url);
    std::unique_ptr<mbf_provision::CachingAgentSource> cache;
    mbf_provision::AgentBinarySource *source = &fetcher;
    if (config.agent.cache_dir) {
      cache = std::make_unique<mbf_provision::CachingAgentSource>(
          fetcher, *config.agent.cache_dir, config.agent.sha1);
      source = cache.get();
    }

    mbf_provision::ProvisioningOptions provisioning;
    provisioning.remote_path = config.agent.remote_path;
    provisioning.expected_sha1 = config.agent.sha1;
    mbf_provision::AgentProvisioner provisioner(device, *source, provisioning);

    mbf_client::ClientOptions options;
    options.agent_path = config.agent.remote_path;
    options.uploads_dir = config.uploads_dir;
    options.core_mod_override_url = config.core_mod_override_url;
    mbf_client::AgentClient client(device, &provisioner, options, sink);

    return run_command(cl, client);
  } catch (const mbf_link::AgentFailure &e) {
    log_err(std::string(mbf_link::to_string(e.kind())) + " error: " + e.what());
    return exit_code_for(e.kind());
  } catch (const std::exception &e) {
    log_err(std::string("FATAL: ") + e.what());
    return kExitUsage;
  }
}
