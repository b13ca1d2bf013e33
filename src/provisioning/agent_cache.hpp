#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "provisioning/fetcher.hpp"

namespace mbf_provision {

/**
 * @brief Keeps a verified copy of the agent on the local disk.
 *
 * The cached file is `<cache_dir>/mbf-agent-<SHA1>` and is only used when its
 * content still hashes to that SHA1. On a miss the upstream source is asked
 * and the result stored for next time. Failing to store is not fatal.
 */
class CachingAgentSource : public AgentBinarySource {
public:
  CachingAgentSource(AgentBinarySource &upstream,
                     std::filesystem::path cache_dir, std::string expected_sha1);

  std::vector<uint8_t> fetch(const LogEventSink &sink) override;

  std::filesystem::path cache_file() const;

private:
  std::optional<std::vector<uint8_t>> load_cached() const;
  void store(const std::vector<uint8_t> &data) const;

  AgentBinarySource &upstream_;
  std::filesystem::path cache_dir_;
  std::string expected_sha1_;
};

} // namespace mbf_provision
