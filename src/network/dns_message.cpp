#include "network/dns_message.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <cstring>

namespace dnsfs {
namespace network {

namespace {

// Pointer to the question name, which always starts right after the header
constexpr uint16_t QUESTION_NAME_POINTER = 0xC000 | DnsHeader::SIZE;
constexpr size_t MAX_POINTER_JUMPS = 16;

// Bounds-checked big-endian reader over a datagram
class ByteReader {
public:
  explicit ByteReader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {}

  uint16_t read_u16() {
    require(sizeof(uint16_t));
    uint16_t network_value;
    std::memcpy(&network_value, data_.data() + offset_, sizeof(network_value));
    offset_ += sizeof(network_value);
    return boost::endian::big_to_native(network_value);
  }

  uint32_t read_u32() {
    require(sizeof(uint32_t));
    uint32_t network_value;
    std::memcpy(&network_value, data_.data() + offset_, sizeof(network_value));
    offset_ += sizeof(network_value);
    return boost::endian::big_to_native(network_value);
  }

  void skip(size_t count) {
    require(count);
    offset_ += count;
  }

  // Reads a possibly compressed name and leaves the cursor after its in-place part
  std::string read_name() {
    std::string name;
    size_t cursor = offset_;
    size_t jumps = 0;
    bool jumped = false;

    while (true) {
      if (cursor >= data_.size()) {
        throw DnsFormatError("name runs past end of message");
      }
      uint8_t length = data_[cursor];

      if ((length & 0xC0) == 0xC0) {
        if (cursor + 1 >= data_.size()) {
          throw DnsFormatError("truncated compression pointer");
        }
        if (++jumps > MAX_POINTER_JUMPS) {
          throw DnsFormatError("compression pointer loop");
        }
        size_t target = (static_cast<size_t>(length & 0x3F) << 8) | data_[cursor + 1];
        if (!jumped) {
          offset_ = cursor + 2;
          jumped = true;
        }
        cursor = target;
        continue;
      }
      if ((length & 0xC0) != 0) {
        throw DnsFormatError("unsupported label type");
      }

      ++cursor;
      if (length == 0) {
        break;
      }
      if (cursor + length > data_.size()) {
        throw DnsFormatError("label runs past end of message");
      }
      name.append(reinterpret_cast<const char*>(data_.data() + cursor), length);
      name.push_back('.');
      if (name.size() > DnsMessageCodec::MAX_NAME_LENGTH) {
        throw DnsFormatError("name exceeds 255 bytes");
      }
      cursor += length;
    }

    if (!jumped) {
      offset_ = cursor;
    }
    return name.empty() ? std::string(".") : name;
  }

  const uint8_t* current() const { return data_.data() + offset_; }

private:
  const std::vector<uint8_t>& data_;
  size_t offset_;

  void require(size_t count) const {
    if (offset_ + count > data_.size()) {
      throw DnsFormatError("message truncated at offset " + std::to_string(offset_));
    }
  }
};

void write_u16(std::vector<uint8_t>& output, uint16_t host_value) {
  uint16_t network_value = boost::endian::native_to_big(host_value);
  const auto* bytes = reinterpret_cast<const uint8_t*>(&network_value);
  output.insert(output.end(), bytes, bytes + sizeof(network_value));
}

void write_u32(std::vector<uint8_t>& output, uint32_t host_value) {
  uint32_t network_value = boost::endian::native_to_big(host_value);
  const auto* bytes = reinterpret_cast<const uint8_t*>(&network_value);
  output.insert(output.end(), bytes, bytes + sizeof(network_value));
}

void write_header(std::vector<uint8_t>& output, const DnsHeader& header) {
  write_u16(output, header.id);
  write_u16(output, header.flags);
  write_u16(output, header.qd_count);
  write_u16(output, header.an_count);
  write_u16(output, header.ns_count);
  write_u16(output, header.ar_count);
}

DnsHeader read_header(ByteReader& reader) {
  DnsHeader header;
  header.id = reader.read_u16();
  header.flags = reader.read_u16();
  header.qd_count = reader.read_u16();
  header.an_count = reader.read_u16();
  header.ns_count = reader.read_u16();
  header.ar_count = reader.read_u16();
  return header;
}

// TXT RDATA is a sequence of <length><bytes> character-strings
std::string read_txt_rdata(const uint8_t* rdata, size_t length) {
  std::string text;
  size_t offset = 0;
  while (offset < length) {
    size_t piece = rdata[offset++];
    if (offset + piece > length) {
      throw DnsFormatError("TXT character-string overruns RDATA");
    }
    text.append(reinterpret_cast<const char*>(rdata + offset), piece);
    offset += piece;
  }
  return text;
}

} // namespace

const char* to_string(ResponseCode rcode) {
  switch (rcode) {
    case ResponseCode::NOERROR: return "NOERROR";
    case ResponseCode::FORMERR: return "FORMERR";
    case ResponseCode::SERVFAIL: return "SERVFAIL";
    case ResponseCode::NXDOMAIN: return "NXDOMAIN";
    case ResponseCode::NOTIMP: return "NOTIMP";
    case ResponseCode::REFUSED: return "REFUSED";
    default: return "RCODE?";
  }
}


//==============================================
// SERVER SIDE
//==============================================

DnsQuery DnsMessageCodec::parse_query(const std::vector<uint8_t>& datagram) {
  ByteReader reader(datagram);
  DnsQuery query;
  query.header = read_header(reader);

  if (query.header.flags & DnsHeader::FLAG_QR) {
    throw DnsFormatError("datagram is a response, not a query");
  }
  if (query.header.qd_count == 0) {
    throw DnsFormatError("query carries no question");
  }

  query.question.name = reader.read_name();
  query.question.type = reader.read_u16();
  query.question.klass = reader.read_u16();

  BOOST_LOG_TRIVIAL(trace) << "DNS codec: Parsed query id " << query.header.id
                           << " for " << query.question.name << " type " << query.question.type;
  return query;
}

std::vector<uint8_t> DnsMessageCodec::encode_response(const DnsQuery& query, ResponseCode rcode,
                                                      const std::optional<std::string>& txt,
                                                      uint32_t ttl) {
  const bool with_answer = txt.has_value() && rcode == ResponseCode::NOERROR;

  DnsHeader header;
  header.id = query.header.id;
  header.flags = static_cast<uint16_t>(
      DnsHeader::FLAG_QR | DnsHeader::FLAG_AA
      | (query.header.flags & (DnsHeader::OPCODE_MASK | DnsHeader::FLAG_RD))
      | static_cast<uint16_t>(rcode));
  header.qd_count = 1;
  header.an_count = with_answer ? 1 : 0;

  std::vector<uint8_t> output;
  output.reserve(DnsHeader::SIZE + query.question.name.size() + 2 + 4 +
                 (with_answer ? txt->size() + txt->size() / MAX_CHARACTER_STRING + 16 : 0));
  write_header(output, header);

  // Question section, echoed
  write_name(output, query.question.name);
  write_u16(output, query.question.type);
  write_u16(output, query.question.klass);

  if (!with_answer) {
    return output;
  }

  // Split payload into character-strings; an empty payload is one empty string
  std::vector<uint8_t> rdata;
  size_t offset = 0;
  do {
    size_t piece = std::min(MAX_CHARACTER_STRING, txt->size() - offset);
    rdata.push_back(static_cast<uint8_t>(piece));
    rdata.insert(rdata.end(), txt->begin() + offset, txt->begin() + offset + piece);
    offset += piece;
  } while (offset < txt->size());

  if (rdata.size() > 0xFFFF) {
    throw DnsFormatError("TXT payload too large: " + std::to_string(txt->size()) + " bytes");
  }

  write_u16(output, QUESTION_NAME_POINTER);
  write_u16(output, TYPE_TXT);
  write_u16(output, CLASS_IN);
  write_u32(output, ttl);
  write_u16(output, static_cast<uint16_t>(rdata.size()));
  output.insert(output.end(), rdata.begin(), rdata.end());
  return output;
}


//==============================================
// CLIENT SIDE
//==============================================

std::vector<uint8_t> DnsMessageCodec::encode_query(uint16_t id, const std::string& name, uint16_t type) {
  DnsHeader header;
  header.id = id;
  header.flags = DnsHeader::FLAG_RD;
  header.qd_count = 1;

  std::vector<uint8_t> output;
  output.reserve(DnsHeader::SIZE + name.size() + 6);
  write_header(output, header);
  write_name(output, name);
  write_u16(output, type);
  write_u16(output, CLASS_IN);
  return output;
}

DnsResponse DnsMessageCodec::parse_response(const std::vector<uint8_t>& datagram) {
  ByteReader reader(datagram);
  DnsHeader header = read_header(reader);

  if (!(header.flags & DnsHeader::FLAG_QR)) {
    throw DnsFormatError("datagram is a query, not a response");
  }

  DnsResponse response;
  response.id = header.id;
  response.rcode = static_cast<ResponseCode>(header.flags & DnsHeader::RCODE_MASK);
  response.answer_count = header.an_count;

  for (uint16_t i = 0; i < header.qd_count; ++i) {
    reader.read_name();
    reader.skip(4);  // type + class
  }

  for (uint16_t i = 0; i < header.an_count; ++i) {
    reader.read_name();
    uint16_t type = reader.read_u16();
    reader.read_u16();  // class
    reader.read_u32();  // ttl
    uint16_t rdlength = reader.read_u16();
    const uint8_t* rdata = reader.current();
    reader.skip(rdlength);

    if (type == TYPE_TXT) {
      response.txt = read_txt_rdata(rdata, rdlength);
      break;
    }
  }

  return response;
}


//==============================================
// NAMES
//==============================================

void DnsMessageCodec::write_name(std::vector<uint8_t>& output, const std::string& name) {
  size_t written = 0;
  size_t start = 0;

  while (start < name.size()) {
    size_t dot = name.find('.', start);
    size_t end = (dot == std::string::npos) ? name.size() : dot;
    size_t length = end - start;

    if (length == 0) {
      // A lone "." is the root; anything else with an empty label is invalid
      if (name == ".") {
        break;
      }
      throw DnsFormatError("empty label in name \"" + name + "\"");
    }
    if (length > MAX_LABEL_LENGTH) {
      throw DnsFormatError("label longer than 63 bytes in \"" + name + "\"");
    }

    output.push_back(static_cast<uint8_t>(length));
    output.insert(output.end(), name.begin() + start, name.begin() + end);
    written += length + 1;
    if (written + 1 > MAX_NAME_LENGTH) {
      throw DnsFormatError("name exceeds 255 bytes");
    }

    if (dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }

  output.push_back(0);
}

} // namespace network
} // namespace dnsfs
