#include <gtest/gtest.h>
#include "crypto/base64.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace dnsfs::crypto;
using dnsfs::test::to_bytes;
using dnsfs::test::make_bytes;

TEST(DigestTest, KnownVectors) {
  EXPECT_EQ(sha256_hex({}), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(sha256_hex(to_bytes("abc")), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex(to_bytes("hello world")),
            "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST(DigestTest, RawDigestMatchesHex) {
  auto data = make_bytes(1000);
  auto raw = sha256(data);
  EXPECT_EQ(to_hex(raw.data(), raw.size()), sha256_hex(data));
  EXPECT_EQ(sha256_hex(data).size(), 64u);
}

TEST(Base64Test, Rfc4648Vectors) {
  const std::vector<std::pair<std::string, std::string>> vectors = {
    {"", ""},
    {"f", "Zg=="},
    {"fo", "Zm8="},
    {"foo", "Zm9v"},
    {"foob", "Zm9vYg=="},
    {"fooba", "Zm9vYmE="},
    {"foobar", "Zm9vYmFy"}
  };

  for (const auto& [plain, encoded] : vectors) {
    EXPECT_EQ(base64_encode(to_bytes(plain)), encoded) << "encoding \"" << plain << "\"";
    EXPECT_EQ(base64_decode(encoded), to_bytes(plain)) << "decoding \"" << encoded << "\"";
    EXPECT_EQ(base64_encoded_size(plain.size()), encoded.size());
  }
}

TEST(Base64Test, BinaryDataSurvives) {
  for (size_t size : {1u, 2u, 3u, 255u, 256u, 4097u}) {
    auto data = make_bytes(size, static_cast<uint32_t>(size));
    EXPECT_EQ(base64_decode(base64_encode(data)), data) << "size " << size;
  }
}

TEST(Base64Test, RejectsMalformedInput) {
  EXPECT_THROW(base64_decode("abc"), EncodingError);       // length not a multiple of 4
  EXPECT_THROW(base64_decode("ab=c"), EncodingError);      // padding in the middle
  EXPECT_THROW(base64_decode("a$b="), EncodingError);      // outside the alphabet
  EXPECT_THROW(base64_decode("a==="), EncodingError);      // too much padding
  EXPECT_THROW(base64_decode("Zg==Zg=="), EncodingError);  // padding before more data
}
