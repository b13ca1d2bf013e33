#include "agent_cache.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include "provisioning/sha1.hpp"

namespace mbf_provision {

namespace fs = std::filesystem;

CachingAgentSource::CachingAgentSource(AgentBinarySource &upstream,
                                       fs::path cache_dir,
                                       std::string expected_sha1)
    : upstream_(upstream), cache_dir_(std::move(cache_dir)),
      expected_sha1_(std::move(expected_sha1)) {}

fs::path CachingAgentSource::cache_file() const {
  std::string name = "mbf-agent-";
  for (const char c : expected_sha1_) {
    name += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return cache_dir_ / name;
}

std::vector<uint8_t> CachingAgentSource::fetch(const LogEventSink &sink) {
  if (auto cached = load_cached()) {
    mbf_session::log_info(sink, "Using cached agent");
    return std::move(*cached);
  }

  std::vector<uint8_t> data = upstream_.fetch(sink);
  if (same_digest(sha1_hex(data), expected_sha1_)) {
    store(data);
  }
  return data;
}

std::optional<std::vector<uint8_t>> CachingAgentSource::load_cached() const {
  const fs::path path = cache_file();
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return std::nullopt;
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "[Provision] cannot read cached agent " << path << "\n";
    return std::nullopt;
  }
  std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());

  if (!same_digest(sha1_hex(data), expected_sha1_)) {
    std::cerr << "[Provision] ignoring corrupt cached agent " << path << "\n";
    return std::nullopt;
  }
  return data;
}

void CachingAgentSource::store(const std::vector<uint8_t> &data) const {
  std::error_code ec;
  fs::create_directories(cache_dir_, ec);
  if (ec) {
    std::cerr << "[Provision] cannot create cache directory " << cache_dir_
              << ": " << ec.message() << "\n";
    return;
  }

  const fs::path target = cache_file();
  fs::path tmp = target;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!out) {
      std::cerr << "[Provision] cannot write " << tmp << "\n";
      fs::remove(tmp, ec);
      return;
    }
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    std::cerr << "[Provision] cannot store cached agent " << target << ": "
              << ec.message() << "\n";
    fs::remove(tmp, ec);
  }
}

} // namespace mbf_provision
