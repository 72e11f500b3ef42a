#include "protocol/chunk_codec.hpp"
#include "protocol/protocol_error.hpp"
#include "crypto/base64.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace dnsfs {
namespace protocol {

ChunkCodec::ChunkCodec(size_t width) : width_(width) {
  if (width_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Invalid chunk width: 0";
    throw std::invalid_argument("Chunk codec: chunk width must be at least 1");
  }
}

//==============================================
// ENCODING
//==============================================

ChunkSequence ChunkCodec::encode(const Bytes& data) const {
  const std::string text = crypto::base64_encode(data);

  ChunkSequence chunks;
  chunks.reserve(text.size() / width_ + (text.size() % width_ != 0 ? 1 : 0));
  for (size_t offset = 0; offset < text.size(); offset += width_) {
    chunks.push_back(text.substr(offset, width_));
  }

  BOOST_LOG_TRIVIAL(trace) << "Chunk codec: Encoded " << data.size() << " bytes into "
                           << chunks.size() << " chunks of width " << width_;
  return chunks;
}

std::optional<std::string> ChunkCodec::chunk_at(const Bytes& data, size_t index) const {
  if (index >= chunk_count(data)) {
    return std::nullopt;
  }

  // Only the requested window is kept, but the whole file is re-encoded
  const std::string text = crypto::base64_encode(data);
  return text.substr(index * width_, width_);
}

size_t ChunkCodec::chunk_count(const Bytes& data) const {
  const size_t encoded = crypto::base64_encoded_size(data.size());
  // No "+ width_ - 1" rounding: it wraps for widths near SIZE_MAX
  return encoded / width_ + (encoded % width_ != 0 ? 1 : 0);
}


//==============================================
// DECODING
//==============================================

Bytes ChunkCodec::decode(const ChunkSequence& chunks) {
  std::string joined;
  size_t total = 0;
  for (const auto& chunk : chunks) {
    total += chunk.size();
  }
  joined.reserve(total);
  for (const auto& chunk : chunks) {
    joined += chunk;
  }

  try {
    return crypto::base64_decode(joined);
  }
  catch (const crypto::EncodingError& e) {
    BOOST_LOG_TRIVIAL(error) << "Chunk codec: Failed to decode " << chunks.size()
                             << " chunks: " << e.what();
    throw ProtocolError(std::string("chunk text is not valid base64: ") + e.what());
  }
}

} // namespace protocol
} // namespace dnsfs
