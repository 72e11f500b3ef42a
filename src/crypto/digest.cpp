#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>

namespace dnsfs::crypto {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

namespace {

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

} // namespace


//==============================================
// HASHING
//==============================================

std::array<uint8_t, SHA256_SIZE> sha256(const std::vector<uint8_t>& data) {
  DigestContext context;

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to initialize SHA-256 context";
    throw DigestError("Failed to initialize hash context");
  }

  // Feed the input data into the hash function
  if (!data.empty() && !EVP_DigestUpdate(context.get(), data.data(), data.size())) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to update hash with " << data.size() << " bytes";
    throw DigestError("Failed to update hash");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), hash, &hash_len) || hash_len != SHA256_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to finalize hash";
    throw DigestError("Failed to finalize hash");
  }

  std::array<uint8_t, SHA256_SIZE> result{};
  std::copy(hash, hash + SHA256_SIZE, result.begin());
  return result;
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
  auto digest = sha256(data);
  return to_hex(digest.data(), digest.size());
}

std::string to_hex(const uint8_t* data, size_t length) {
  std::stringstream ss;
  for (size_t i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(data[i]);
  }
  return ss.str();
}

} // namespace dnsfs::crypto
