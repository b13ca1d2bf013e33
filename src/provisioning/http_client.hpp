#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mbf_provision {

// Failure of a single transfer (network error, non-2xx status, ...).
class HttpError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bytes received so far and total expected; total is 0 when unknown.
using ProgressCallback = std::function<void(uint64_t received, uint64_t total)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;

  // Downloads url into memory in one attempt. Throws HttpError on failure.
  virtual std::vector<uint8_t> get(const std::string &url,
                                   const ProgressCallback &progress) = 0;
};

} // namespace mbf_provision
