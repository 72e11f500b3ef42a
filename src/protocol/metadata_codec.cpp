#include "protocol/metadata_codec.hpp"
#include "protocol/protocol_error.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>

namespace dnsfs {
namespace protocol {

namespace {

const char* const KEY_CHUNKS = "chunks";
const char* const KEY_ENCODING = "enc";
const char* const KEY_DIGEST = "sha256";
const char* const KEY_BYTES = "bytes";

std::string trim(const std::string& value) {
  const char* whitespace = " \t\r\n";
  auto first = value.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return std::string();
  }
  auto last = value.find_last_not_of(whitespace);
  return value.substr(first, last - first + 1);
}

std::optional<uint64_t> parse_unsigned(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  uint64_t result = 0;
  const char* begin = value.data();
  const char* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(begin, end, result);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return result;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

const char* to_string(Encoding encoding) {
  switch (encoding) {
    case Encoding::BASE64: return "base64";
    default: return "unknown";
  }
}

bool operator==(const Metadata& lhs, const Metadata& rhs) {
  return lhs.chunk_count == rhs.chunk_count &&
         lhs.encoding == rhs.encoding &&
         lhs.digest == rhs.digest &&
         lhs.byte_length == rhs.byte_length;
}


//==============================================
// WIRE FORMAT
//==============================================

std::string MetadataCodec::format(const Metadata& metadata) {
  std::ostringstream out;
  out << KEY_CHUNKS << '=' << metadata.chunk_count
      << ';' << KEY_ENCODING << '=' << to_string(metadata.encoding);
  if (metadata.digest) {
    out << ';' << KEY_DIGEST << '=' << *metadata.digest;
  }
  if (metadata.byte_length) {
    out << ';' << KEY_BYTES << '=' << *metadata.byte_length;
  }
  return out.str();
}

Metadata MetadataCodec::parse(const std::string& text) {
  Metadata metadata;
  std::optional<uint64_t> chunk_count;
  bool saw_chunks = false;

  std::istringstream segments(text);
  std::string segment;
  while (std::getline(segments, segment, ';')) {
    auto separator = segment.find('=');
    if (separator == std::string::npos) {
      continue;
    }

    const std::string key = trim(segment.substr(0, separator));
    const std::string value = trim(segment.substr(separator + 1));

    if (key == KEY_CHUNKS) {
      saw_chunks = true;
      chunk_count = parse_unsigned(value);
    } else if (key == KEY_ENCODING) {
      metadata.encoding = to_lower(value) == to_string(Encoding::BASE64)
                            ? Encoding::BASE64 : Encoding::UNKNOWN;
    } else if (key == KEY_DIGEST) {
      metadata.digest = value.empty() ? std::nullopt : std::optional<std::string>(to_lower(value));
    } else if (key == KEY_BYTES) {
      metadata.byte_length = parse_unsigned(value);
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Metadata codec: Ignoring unknown key: " << key;
    }
  }

  if (!saw_chunks) {
    throw MalformedMetadata("missing 'chunks' in \"" + text + "\"");
  }
  if (!chunk_count) {
    throw MalformedMetadata("non-numeric 'chunks' in \"" + text + "\"");
  }

  metadata.chunk_count = *chunk_count;
  return metadata;
}


//==============================================
// DERIVATION
//==============================================

Metadata MetadataCodec::describe(const Bytes& data, const ChunkCodec& codec) {
  Metadata metadata;
  metadata.chunk_count = codec.chunk_count(data);
  metadata.encoding = Encoding::BASE64;
  metadata.digest = crypto::sha256_hex(data);
  metadata.byte_length = data.size();
  return metadata;
}

} // namespace protocol
} // namespace dnsfs
