#pragma once

#include <chrono>

#include "provisioning/http_client.hpp"

namespace mbf_provision {

/**
 * @brief HttpClient over a libcurl easy handle, one handle per transfer.
 *
 * Redirects are followed. An attempt fails when the connection cannot be
 * made within connect_timeout, when it stalls below 1 byte/s for
 * stall_timeout, or when the server answers with a non-2xx status.
 */
class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient();

  std::vector<uint8_t> get(const std::string &url,
                           const ProgressCallback &progress) override;

  std::chrono::seconds connect_timeout{30};
  std::chrono::seconds stall_timeout{60};
};

} // namespace mbf_provision
