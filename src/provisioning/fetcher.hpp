#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/log_sink.hpp"
#include "provisioning/http_client.hpp"

namespace mbf_provision {

using mbf_session::LogEventSink;

using SteadyClock = std::function<std::chrono::steady_clock::time_point()>;

// Where provisioning gets the agent executable from.
class AgentBinarySource {
public:
  virtual ~AgentBinarySource() = default;

  // Throws mbf_link::ProvisioningError when no bytes can be obtained.
  virtual std::vector<uint8_t> fetch(const LogEventSink &sink) = 0;
};

/**
 * @brief Rate limiter for download progress messages.
 *
 * tick() yields a percentage only when more than `interval` has passed since
 * the throttle was created or last yielded, and never when the total size is
 * unknown (0).
 */
class ProgressThrottle {
public:
  ProgressThrottle(std::chrono::milliseconds interval, SteadyClock clock);

  std::optional<double> tick(uint64_t received, uint64_t total);

private:
  std::chrono::milliseconds interval_;
  SteadyClock clock_;
  std::chrono::steady_clock::time_point last_;
};

// "42.5", "100": percentage rounded to one decimal, trailing ".0" dropped.
std::string format_percent(double percent);

struct FetchPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds progress_interval{1000};
  SteadyClock clock = [] { return std::chrono::steady_clock::now(); };
};

/**
 * @brief Downloads the agent, retrying failed transfers.
 *
 * Makes at most policy.max_attempts calls to the HTTP client and returns the
 * first complete payload. Each failure is reported to the sink; once all
 * attempts failed a ProvisioningError advising a connectivity check is thrown.
 */
class ResilientFetcher : public AgentBinarySource {
public:
  ResilientFetcher(HttpClient &http, std::string url, FetchPolicy policy = {});

  std::vector<uint8_t> fetch(const LogEventSink &sink) override;

  int attempts_made() const { return attempts_made_; }

private:
  HttpClient &http_;
  std::string url_;
  FetchPolicy policy_;
  int attempts_made_ = 0;
};

} // namespace mbf_provision
