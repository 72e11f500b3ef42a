#ifndef DNSFS_PROTOCOL_METADATA_CODEC_HPP
#define DNSFS_PROTOCOL_METADATA_CODEC_HPP

#include <cstdint>
#include <optional>
#include <string>
#include "protocol/types.hpp"
#include "protocol/chunk_codec.hpp"

namespace dnsfs {
namespace protocol {

enum class Encoding : uint8_t {
  BASE64 = 0,
  UNKNOWN = 0xFF
};

const char* to_string(Encoding encoding);

// Descriptor served for meta.<name>.<zone>
struct Metadata {
  uint64_t chunk_count = 0;
  Encoding encoding = Encoding::BASE64;
  // Lowercase hex SHA-256; absent means skip the digest check
  std::optional<std::string> digest;
  // Absent (or zero) means skip the length check
  std::optional<uint64_t> byte_length;
};

bool operator==(const Metadata& lhs, const Metadata& rhs);

class MetadataCodec {
public:
  // ---- WIRE FORMAT ----
  // "chunks=<N>;enc=base64;sha256=<hex>;bytes=<M>", fixed key order.
  // Absent optional fields are omitted.
  static std::string format(const Metadata& metadata);

  // Recognized keys:
  //   chunks  required, unsigned decimal, else MalformedMetadata
  //   enc     optional, "base64" or recorded as UNKNOWN; absent means base64
  //   sha256  optional, lowercased; absent or empty skips the digest check
  //   bytes   optional, unsigned decimal; absent or non-numeric skips the length check
  // Unknown keys and segments without '=' are ignored.
  static Metadata parse(const std::string& text);


  // ---- DERIVATION ----
  // Metadata of a stored file as encoded by codec
  static Metadata describe(const Bytes& data, const ChunkCodec& codec);
};

} // namespace protocol
} // namespace dnsfs

#endif // DNSFS_PROTOCOL_METADATA_CODEC_HPP
