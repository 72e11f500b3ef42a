#ifndef DNSFS_CRYPTO_ERROR_HPP
#define DNSFS_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dnsfs::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

class EncodingError : public CryptoError {
public:
    explicit EncodingError(const std::string& message) 
        : CryptoError("Encoding error: " + message) {}
};

} // namespace dnsfs::crypto

#endif // DNSFS_CRYPTO_ERROR_HPP
