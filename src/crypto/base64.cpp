#include "crypto/base64.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace dnsfs::crypto {

namespace {

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

// Number of '=' padding characters, or throws if padding is misplaced
size_t validate_and_count_padding(const std::string& text) {
  if (text.size() % 4 != 0) {
    throw EncodingError("base64 length " + std::to_string(text.size()) + " is not a multiple of 4");
  }

  size_t padding = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '=') {
      // Padding only allowed in the final two positions
      if (i + 2 < text.size()) {
        throw EncodingError("misplaced padding at offset " + std::to_string(i));
      }
      ++padding;
    } else if (padding > 0 || !is_base64_char(c)) {
      throw EncodingError("invalid base64 character at offset " + std::to_string(i));
    }
  }
  return padding;
}

} // namespace


//==============================================
// ENCODING
//==============================================

std::string base64_encode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return std::string();
  }

  // EVP_EncodeBlock writes a trailing NUL
  std::string output(base64_encoded_size(data.size()) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                                data.data(), static_cast<int>(data.size()));
  if (written < 0) {
    BOOST_LOG_TRIVIAL(error) << "Base64: EVP_EncodeBlock failed for " << data.size() << " bytes";
    throw EncodingError("EVP_EncodeBlock failed");
  }

  output.resize(static_cast<size_t>(written));
  return output;
}


//==============================================
// DECODING
//==============================================

std::vector<uint8_t> base64_decode(const std::string& text) {
  if (text.empty()) {
    return {};
  }

  size_t padding = validate_and_count_padding(text);

  std::vector<uint8_t> output((text.size() / 4) * 3);
  int decoded = EVP_DecodeBlock(output.data(),
                                reinterpret_cast<const unsigned char*>(text.data()),
                                static_cast<int>(text.size()));
  if (decoded < 0) {
    BOOST_LOG_TRIVIAL(error) << "Base64: EVP_DecodeBlock rejected " << text.size() << " characters";
    throw EncodingError("EVP_DecodeBlock failed");
  }

  // EVP_DecodeBlock counts padding as zero bytes
  output.resize(static_cast<size_t>(decoded) - padding);
  return output;
}

} // namespace dnsfs::crypto
