#include <gtest/gtest.h>
#include "protocol/chunk_codec.hpp"
#include "protocol/protocol_error.hpp"
#include "crypto/base64.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <limits>

using namespace dnsfs::protocol;
using dnsfs::test::to_bytes;
using dnsfs::test::make_bytes;

class ChunkCodecTest : public ::testing::Test {
protected:
  ChunkCodec codec{DEFAULT_CHUNK_WIDTH};

  static size_t expected_count(size_t byte_count, size_t width) {
    size_t encoded = dnsfs::crypto::base64_encoded_size(byte_count);
    return (encoded + width - 1) / width;
  }
};

TEST_F(ChunkCodecTest, HelloWorldIsOneChunk) {
  auto chunks = codec.encode(to_bytes("hello world"));
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0], "aGVsbG8gd29ybGQ=");
  EXPECT_EQ(codec.chunk_count(to_bytes("hello world")), 1u);
}

TEST_F(ChunkCodecTest, EmptyInputHasNoChunks) {
  EXPECT_TRUE(codec.encode({}).empty());
  EXPECT_EQ(codec.chunk_count({}), 0u);
  EXPECT_FALSE(codec.chunk_at({}, 0).has_value());
  EXPECT_TRUE(ChunkCodec::decode({}).empty());
}

TEST_F(ChunkCodecTest, RoundTripAcrossChunkBoundaries) {
  // 135 bytes -> exactly 180 base64 characters; neighbours straddle the boundary
  for (size_t size : {1u, 2u, 3u, 134u, 135u, 136u, 270u, 271u, 1000u, 65536u}) {
    auto data = make_bytes(size, static_cast<uint32_t>(size));
    auto chunks = codec.encode(data);
    EXPECT_EQ(chunks.size(), expected_count(size, codec.width())) << "size " << size;
    EXPECT_EQ(ChunkCodec::decode(chunks), data) << "size " << size;
  }
}

TEST_F(ChunkCodecTest, ChunksRespectWidth) {
  auto chunks = codec.encode(make_bytes(5000));
  ASSERT_GT(chunks.size(), 1u);
  for (size_t i = 0; i + 1 < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].size(), codec.width()) << "chunk " << i;
  }
  EXPECT_GE(chunks.back().size(), 1u);
  EXPECT_LE(chunks.back().size(), codec.width());
}

TEST_F(ChunkCodecTest, ExactMultipleHasFullLastChunk) {
  auto data = make_bytes(270);   // 360 base64 chars = 2 * 180
  auto chunks = codec.encode(data);
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks.back().size(), codec.width());
}

TEST_F(ChunkCodecTest, OrderedJoinReproducesBase64) {
  auto data = make_bytes(2000, 7);
  auto chunks = codec.encode(data);

  std::string joined;
  for (const auto& chunk : chunks) {
    joined += chunk;
  }
  EXPECT_EQ(joined, dnsfs::crypto::base64_encode(data));
}

TEST_F(ChunkCodecTest, ChunkAtMatchesEncode) {
  ChunkCodec narrow(7);
  auto data = make_bytes(100, 3);
  auto chunks = narrow.encode(data);
  ASSERT_EQ(chunks.size(), narrow.chunk_count(data));

  for (size_t i = 0; i < chunks.size(); ++i) {
    auto chunk = narrow.chunk_at(data, i);
    ASSERT_TRUE(chunk.has_value()) << "index " << i;
    EXPECT_EQ(*chunk, chunks[i]);
  }
  EXPECT_FALSE(narrow.chunk_at(data, chunks.size()).has_value());
  EXPECT_FALSE(narrow.chunk_at(data, chunks.size() + 100).has_value());
}

TEST_F(ChunkCodecTest, WidthOfOneCharacter) {
  ChunkCodec single(1);
  auto data = to_bytes("hi");
  auto chunks = single.encode(data);
  EXPECT_EQ(chunks.size(), 4u);
  EXPECT_EQ(ChunkCodec::decode(chunks), data);
}

TEST_F(ChunkCodecTest, ZeroWidthIsRejected) {
  EXPECT_THROW(ChunkCodec(0), std::invalid_argument);
}

TEST_F(ChunkCodecTest, SwappedChunksDoNotDecodeToOriginal) {
  ChunkCodec narrow(8);
  auto data = to_bytes("the quick brown fox jumps over the lazy dog");
  auto chunks = narrow.encode(data);
  ASSERT_GT(chunks.size(), 2u);
  std::swap(chunks[0], chunks[1]);

  // Either undecodable or different bytes; never the original
  try {
    EXPECT_NE(ChunkCodec::decode(chunks), data);
  } catch (const ProtocolError&) {
    SUCCEED();
  }
}

TEST_F(ChunkCodecTest, InvalidTextIsProtocolError) {
  EXPECT_THROW(ChunkCodec::decode({"aGVs", "bG8"}), ProtocolError);
  EXPECT_THROW(ChunkCodec::decode({"****"}), ProtocolError);
}

TEST_F(ChunkCodecTest, HugeWidthCountsOneChunk) {
  ChunkCodec widest(std::numeric_limits<size_t>::max());
  auto hello = to_bytes("hello world");

  EXPECT_EQ(widest.chunk_count(hello), 1u);
  EXPECT_EQ(widest.encode(hello).size(), 1u);
  auto chunk = widest.chunk_at(hello, 0);
  ASSERT_TRUE(chunk.has_value());
  EXPECT_EQ(*chunk, "aGVsbG8gd29ybGQ=");
  EXPECT_FALSE(widest.chunk_at(hello, 1).has_value());
  EXPECT_EQ(widest.chunk_count({}), 0u);
}
