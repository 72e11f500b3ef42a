#ifndef DNSFS_PROTOCOL_TYPES_HPP
#define DNSFS_PROTOCOL_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dnsfs {
namespace protocol {

using Bytes = std::vector<uint8_t>;
// Chunk texts in ascending index order
using ChunkSequence = std::vector<std::string>;

static constexpr size_t DEFAULT_CHUNK_WIDTH = 180;

// Receive buffer size on both ends of the wire
static constexpr size_t MAX_DATAGRAM_SIZE = 4096;

// Widest chunk whose TXT response still fits MAX_DATAGRAM_SIZE: 12-byte header,
// question with a 255-byte name, 12-byte answer RR header, plus one length byte
// per 255-byte character-string.
static constexpr size_t MAX_CHUNK_WIDTH = 3600;
static_assert(12 + (255 + 4) + 12 + MAX_CHUNK_WIDTH + (MAX_CHUNK_WIDTH + 254) / 255 <= MAX_DATAGRAM_SIZE,
              "MAX_CHUNK_WIDTH does not fit in a datagram");
static constexpr const char* DEFAULT_ZONE = "lab.";

// DNS RR type codes for the records the protocol cares about
enum class RecordType : uint16_t {
  A = 1,
  CNAME = 5,
  TXT = 16,
  AAAA = 28,
  ANY = 255
};

struct Query {
  std::string qualified_name;
  uint16_t record_type = static_cast<uint16_t>(RecordType::TXT);
};

// Wire-level status; every failure collapses to NOT_FOUND
enum class ReplyStatus : uint8_t {
  OK = 0,
  NOT_FOUND = 1
};

struct Reply {
  ReplyStatus status = ReplyStatus::NOT_FOUND;
  std::optional<std::string> payload;

  static Reply ok(std::string text) { return Reply{ReplyStatus::OK, std::move(text)}; }
  static Reply not_found() { return Reply{ReplyStatus::NOT_FOUND, std::nullopt}; }
};

const char* to_string(ReplyStatus status);

} // namespace protocol
} // namespace dnsfs

#endif // DNSFS_PROTOCOL_TYPES_HPP
