#include "curl_http_client.hpp"

#include <curl/curl.h>

#include <exception>
#include <memory>
#include <mutex>

namespace mbf_provision {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL *easy) const { curl_easy_cleanup(easy); }
};

// Callbacks run inside curl's C frames and must not throw. An exception is
// parked in `error`, the transfer is aborted, and get() rethrows it.
struct Transfer {
  std::vector<uint8_t> body;
  const ProgressCallback *progress = nullptr;
  std::exception_ptr error;
};

size_t write_body(char *ptr, size_t size, size_t nmemb,
                  void *userdata) noexcept {
  auto *transfer = static_cast<Transfer *>(userdata);
  const size_t n = size * nmemb;
  try {
    transfer->body.insert(transfer->body.end(), ptr, ptr + n);
  } catch (const std::exception &) {
    transfer->error = std::current_exception();
    return 0;
  }
  return n;
}

int report_progress(void *userdata, curl_off_t dltotal, curl_off_t dlnow,
                    curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) noexcept {
  auto *transfer = static_cast<Transfer *>(userdata);
  if (transfer->progress && *transfer->progress) {
    try {
      (*transfer->progress)(static_cast<uint64_t>(dlnow),
                            static_cast<uint64_t>(dltotal));
    } catch (const std::exception &) {
      transfer->error = std::current_exception();
      return 1;
    }
  }
  return 0;
}

template <typename T> void set_option(CURL *easy, CURLoption option, T value) {
  const CURLcode code = curl_easy_setopt(easy, option, value);
  if (code != CURLE_OK) {
    throw HttpError(std::string("curl_easy_setopt failed: ") +
                    curl_easy_strerror(code));
  }
}

void global_init() {
  static std::once_flag once;
  static CURLcode result = CURLE_OK;
  std::call_once(once, [] { result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (result != CURLE_OK) {
    throw HttpError(std::string("curl_global_init failed: ") +
                    curl_easy_strerror(result));
  }
}

} // namespace

CurlHttpClient::CurlHttpClient() { global_init(); }

std::vector<uint8_t> CurlHttpClient::get(const std::string &url,
                                         const ProgressCallback &progress) {
  std::unique_ptr<CURL, CurlEasyDeleter> easy(curl_easy_init());
  if (!easy) {
    throw HttpError("curl_easy_init failed");
  }

  Transfer transfer;
  transfer.progress = &progress;
  char error_buf[CURL_ERROR_SIZE] = {0};

  CURL *h = easy.get();
  set_option(h, CURLOPT_URL, url.c_str());
  set_option(h, CURLOPT_USERAGENT, "mbf-link");
  set_option(h, CURLOPT_NOSIGNAL, 1L);
  set_option(h, CURLOPT_FOLLOWLOCATION, 1L);
  set_option(h, CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(connect_timeout.count()));
  set_option(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
  set_option(h, CURLOPT_LOW_SPEED_TIME,
                   static_cast<long>(stall_timeout.count()));
  set_option(h, CURLOPT_ERRORBUFFER, error_buf);
  set_option(h, CURLOPT_WRITEFUNCTION, write_body);
  set_option(h, CURLOPT_WRITEDATA, &transfer);
  set_option(h, CURLOPT_XFERINFOFUNCTION, report_progress);
  set_option(h, CURLOPT_XFERINFODATA, &transfer);
  set_option(h, CURLOPT_NOPROGRESS, 0L);

  const CURLcode code = curl_easy_perform(h);
  if (transfer.error) {
    std::rethrow_exception(transfer.error);
  }
  if (code != CURLE_OK) {
    throw HttpError(error_buf[0] != '\0' ? std::string(error_buf)
                                         : curl_easy_strerror(code));
  }

  long status = 0;
  if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status) != CURLE_OK) {
    throw HttpError("cannot read response status");
  }
  // file:// and other non-HTTP schemes report 0.
  if (status != 0 && (status < 200 || status >= 300)) {
    throw HttpError("status " + std::to_string(status));
  }
  return std::move(transfer.body);
}

} // namespace mbf_provision
