#include "fetcher.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>

#include "errors.hpp"

namespace mbf_provision {

ProgressThrottle::ProgressThrottle(std::chrono::milliseconds interval,
                                   SteadyClock clock)
    : interval_(interval), clock_(std::move(clock)), last_(clock_()) {}

std::optional<double> ProgressThrottle::tick(uint64_t received,
                                             uint64_t total) {
  if (total == 0) {
    return std::nullopt;
  }

  const auto now = clock_();
  if (now - last_ <= interval_) {
    return std::nullopt;
  }
  last_ = now;
  return static_cast<double>(received) / static_cast<double>(total) * 100.0;
}

std::string format_percent(double percent) {
  const long tenths = std::lround(percent * 10.0);
  if (tenths % 10 == 0) {
    return std::to_string(tenths / 10);
  }
  return std::to_string(tenths / 10) + "." + std::to_string(std::labs(tenths % 10));
}

ResilientFetcher::ResilientFetcher(HttpClient &http, std::string url,
                                   FetchPolicy policy)
    : http_(http), url_(std::move(url)), policy_(std::move(policy)) {}

std::vector<uint8_t> ResilientFetcher::fetch(const LogEventSink &sink) {
  attempts_made_ = 0;

  for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    ++attempts_made_;
    ProgressThrottle throttle(policy_.progress_interval, policy_.clock);
    const ProgressCallback progress = [&](uint64_t received, uint64_t total) {
      if (const auto percent = throttle.tick(received, total)) {
        mbf_session::log_info(sink,
                              "Download " + format_percent(*percent) + "% complete");
      }
    };

    try {
      std::vector<uint8_t> body = http_.get(url_, progress);
      mbf_session::log_info(sink, "Download complete");
      return body;
    } catch (const HttpError &e) {
      std::cerr << "[Fetch] GET " << url_ << " failed: " << e.what() << "\n";
      mbf_session::log_info(sink, "Failed to download agent (attempt " +
                                      std::to_string(attempt) + "/" +
                                      std::to_string(policy_.max_attempts) +
                                      "): " + e.what());
    }

    if (attempt < policy_.max_attempts) {
      mbf_session::log_info(sink, "Trying again...");
    }
  }

  throw mbf_link::ProvisioningError(
      "Failed to fetch agent after multiple attempts.\n"
      "Did you lose internet connection just after starting?\n\n"
      "If not, then please report this issue, including the log output!");
}

} // namespace mbf_provision
