#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mbf_provision {

// SHA1 of data as 40 uppercase hex digits (OpenSSL EVP).
std::string sha1_hex(const std::vector<uint8_t> &data);

// True for exactly 40 hex digits, either case.
bool is_sha1_hex(const std::string &s);

// Case-insensitive comparison of two hex digests.
bool same_digest(const std::string &a, const std::string &b);

} // namespace mbf_provision
