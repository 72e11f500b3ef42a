#ifndef DNSFS_NETWORK_DNS_MESSAGE_HPP
#define DNSFS_NETWORK_DNS_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace dnsfs {
namespace network {

class DnsFormatError : public std::runtime_error {
public:
  explicit DnsFormatError(const std::string& message)
    : std::runtime_error("DNS format error: " + message) {}
};

enum class ResponseCode : uint8_t {
  NOERROR = 0,
  FORMERR = 1,
  SERVFAIL = 2,
  NXDOMAIN = 3,
  NOTIMP = 4,
  REFUSED = 5
};

const char* to_string(ResponseCode rcode);

// Fixed 12-byte header, host byte order
struct DnsHeader {
  uint16_t id = 0;
  uint16_t flags = 0;
  uint16_t qd_count = 0;
  uint16_t an_count = 0;
  uint16_t ns_count = 0;
  uint16_t ar_count = 0;

  static constexpr size_t SIZE = 12;
  static constexpr uint16_t FLAG_QR = 0x8000;
  static constexpr uint16_t FLAG_AA = 0x0400;
  static constexpr uint16_t FLAG_TC = 0x0200;
  static constexpr uint16_t FLAG_RD = 0x0100;
  static constexpr uint16_t FLAG_RA = 0x0080;
  static constexpr uint16_t OPCODE_MASK = 0x7800;
  static constexpr uint16_t RCODE_MASK = 0x000F;
};

struct DnsQuestion {
  // Dotted, with trailing dot ("meta.hello.lab."); "." for the root
  std::string name;
  uint16_t type = 0;
  uint16_t klass = 0;
};

// Incoming query: header plus the first question
struct DnsQuery {
  DnsHeader header;
  DnsQuestion question;
};

// What the client needs out of a response datagram
struct DnsResponse {
  uint16_t id = 0;
  ResponseCode rcode = ResponseCode::NOERROR;
  uint16_t answer_count = 0;
  // Character-strings of the first TXT answer, concatenated
  std::optional<std::string> txt;
};

class DnsMessageCodec {
public:
  static constexpr uint16_t CLASS_IN = 1;
  static constexpr uint16_t TYPE_TXT = 16;
  static constexpr size_t MAX_LABEL_LENGTH = 63;
  static constexpr size_t MAX_NAME_LENGTH = 255;
  static constexpr size_t MAX_CHARACTER_STRING = 255;

  // ---- SERVER SIDE ----
  // Throws DnsFormatError on truncated or malformed datagrams
  static DnsQuery parse_query(const std::vector<uint8_t>& datagram);
  // Answer to query: question echoed, at most one TXT record pointing at the question name
  static std::vector<uint8_t> encode_response(const DnsQuery& query, ResponseCode rcode,
                                              const std::optional<std::string>& txt,
                                              uint32_t ttl);


  // ---- CLIENT SIDE ----
  static std::vector<uint8_t> encode_query(uint16_t id, const std::string& name, uint16_t type);
  static DnsResponse parse_response(const std::vector<uint8_t>& datagram);


  // ---- NAMES ----
  // Appends the wire form of a dotted name; throws DnsFormatError on bad labels
  static void write_name(std::vector<uint8_t>& output, const std::string& name);
};

} // namespace network
} // namespace dnsfs

#endif // DNSFS_NETWORK_DNS_MESSAGE_HPP
