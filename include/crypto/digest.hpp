#ifndef DNSFS_CRYPTO_DIGEST_HPP
#define DNSFS_CRYPTO_DIGEST_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace dnsfs::crypto {

static constexpr size_t SHA256_SIZE = 32;   // 256 bits

// Raw SHA-256 of a byte sequence using OpenSSL EVP
std::array<uint8_t, SHA256_SIZE> sha256(const std::vector<uint8_t>& data);

// Lowercase hex SHA-256, 64 characters
std::string sha256_hex(const std::vector<uint8_t>& data);

// Lowercase hex rendering of arbitrary bytes
std::string to_hex(const uint8_t* data, size_t length);

} // namespace dnsfs::crypto

#endif // DNSFS_CRYPTO_DIGEST_HPP
