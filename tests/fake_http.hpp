#pragma once

#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "provisioning/http_client.hpp"

namespace mbf_test {

// Answers each get() with the next scripted outcome. Progress ticks are
// delivered before the outcome.
class FakeHttp : public mbf_provision::HttpClient {
public:
  struct Outcome {
    bool ok = true;
    std::vector<uint8_t> body;
    std::string error;
    std::vector<std::pair<uint64_t, uint64_t>> ticks;
  };

  void succeed(std::vector<uint8_t> body,
               std::vector<std::pair<uint64_t, uint64_t>> ticks = {}) {
    outcomes_.push_back({true, std::move(body), "", std::move(ticks)});
  }

  void fail(std::string error) {
    outcomes_.push_back({false, {}, std::move(error), {}});
  }

  std::vector<uint8_t> get(const std::string &url,
                           const mbf_provision::ProgressCallback &progress) override {
    urls.push_back(url);
    if (outcomes_.empty()) {
      throw mbf_provision::HttpError("connection refused");
    }
    Outcome outcome = std::move(outcomes_.front());
    outcomes_.pop_front();

    for (const auto &[received, total] : outcome.ticks) {
      if (progress) {
        progress(received, total);
      }
      if (on_tick) {
        on_tick();
      }
    }
    if (!outcome.ok) {
      throw mbf_provision::HttpError(outcome.error);
    }
    return outcome.body;
  }

  std::vector<std::string> urls;
  std::function<void()> on_tick;

private:
  std::deque<Outcome> outcomes_;
};

} // namespace mbf_test
