#ifndef DNSFS_CRYPTO_BASE64_HPP
#define DNSFS_CRYPTO_BASE64_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace dnsfs::crypto {

// Standard alphabet with '=' padding, no line breaks
std::string base64_encode(const std::vector<uint8_t>& data);

// Inverse of base64_encode; throws EncodingError on malformed input
std::vector<uint8_t> base64_decode(const std::string& text);

// Length of base64_encode(data) for data of the given size
constexpr size_t base64_encoded_size(size_t byte_count) {
  return ((byte_count + 2) / 3) * 4;
}

} // namespace dnsfs::crypto

#endif // DNSFS_CRYPTO_BASE64_HPP
