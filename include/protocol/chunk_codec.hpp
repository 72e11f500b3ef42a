#ifndef DNSFS_PROTOCOL_CHUNK_CODEC_HPP
#define DNSFS_PROTOCOL_CHUNK_CODEC_HPP

#include <optional>
#include <string>
#include "protocol/types.hpp"

namespace dnsfs {
namespace protocol {

// Splits base64(file) into fixed-width chunks and joins them back.
// Stateless apart from the width, safe to share between threads.
class ChunkCodec {
public:
  // ---- CONSTRUCTOR ----
  explicit ChunkCodec(size_t width = DEFAULT_CHUNK_WIDTH);


  // ---- ENCODING ----
  // base64 text partitioned into chunks of at most width() characters
  ChunkSequence encode(const Bytes& data) const;
  // Single chunk by index, nullopt when index >= chunk_count(data)
  std::optional<std::string> chunk_at(const Bytes& data, size_t index) const;
  // ceil(len(base64(data)) / width()); zero for empty data
  size_t chunk_count(const Bytes& data) const;


  // ---- DECODING ----
  // Concatenates chunks in the given order and base64-decodes the result.
  // Throws ProtocolError if the joined text is not valid base64.
  static Bytes decode(const ChunkSequence& chunks);


  // ---- GETTERS ----
  size_t width() const { return width_; }

private:
  // ---- PARAMETERS ----
  size_t width_;
};

} // namespace protocol
} // namespace dnsfs

#endif // DNSFS_PROTOCOL_CHUNK_CODEC_HPP
