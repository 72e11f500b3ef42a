#include <gtest/gtest.h>
#include "network/dns_message.hpp"

using namespace dnsfs::network;

namespace {

// Header plus a single question, built by hand
std::vector<uint8_t> raw_query(uint16_t flags, uint16_t qd_count, const std::vector<uint8_t>& question) {
  std::vector<uint8_t> datagram = {
    0x12, 0x34,
    static_cast<uint8_t>(flags >> 8), static_cast<uint8_t>(flags & 0xFF),
    0x00, static_cast<uint8_t>(qd_count),
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00
  };
  datagram.insert(datagram.end(), question.begin(), question.end());
  return datagram;
}

uint16_t read_u16_at(const std::vector<uint8_t>& data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

} // namespace

TEST(DnsMessageTest, QueryRoundTrip) {
  auto datagram = DnsMessageCodec::encode_query(0xBEEF, "meta.hello.lab.", DnsMessageCodec::TYPE_TXT);
  ASSERT_GE(datagram.size(), DnsHeader::SIZE);
  EXPECT_EQ(read_u16_at(datagram, 0), 0xBEEF);
  EXPECT_EQ(read_u16_at(datagram, 2), DnsHeader::FLAG_RD);

  auto query = DnsMessageCodec::parse_query(datagram);
  EXPECT_EQ(query.header.id, 0xBEEF);
  EXPECT_EQ(query.header.qd_count, 1);
  EXPECT_EQ(query.question.name, "meta.hello.lab.");
  EXPECT_EQ(query.question.type, DnsMessageCodec::TYPE_TXT);
  EXPECT_EQ(query.question.klass, DnsMessageCodec::CLASS_IN);
}

TEST(DnsMessageTest, NameWireFormat) {
  std::vector<uint8_t> output;
  DnsMessageCodec::write_name(output, "meta.hello.lab");
  const std::vector<uint8_t> expected = {
    4, 'm', 'e', 't', 'a', 5, 'h', 'e', 'l', 'l', 'o', 3, 'l', 'a', 'b', 0
  };
  EXPECT_EQ(output, expected);

  std::vector<uint8_t> root;
  DnsMessageCodec::write_name(root, ".");
  EXPECT_EQ(root, std::vector<uint8_t>{0});
}

TEST(DnsMessageTest, RejectsBadNames) {
  std::vector<uint8_t> output;
  EXPECT_THROW(DnsMessageCodec::write_name(output, "meta..lab."), DnsFormatError);
  EXPECT_THROW(DnsMessageCodec::write_name(output, std::string(64, 'a') + ".lab."), DnsFormatError);

  std::string long_name;
  for (int i = 0; i < 5; ++i) {
    long_name += std::string(60, 'a') + ".";
  }
  EXPECT_THROW(DnsMessageCodec::write_name(output, long_name), DnsFormatError);

  EXPECT_NO_THROW(DnsMessageCodec::write_name(output, std::string(63, 'a') + ".lab."));
}

TEST(DnsMessageTest, RejectsMalformedQueries) {
  EXPECT_THROW(DnsMessageCodec::parse_query({}), DnsFormatError);
  EXPECT_THROW(DnsMessageCodec::parse_query({0x00, 0x01, 0x00}), DnsFormatError);

  const std::vector<uint8_t> lab = {3, 'l', 'a', 'b', 0, 0x00, 0x10, 0x00, 0x01};
  // Response bit set
  EXPECT_THROW(DnsMessageCodec::parse_query(raw_query(DnsHeader::FLAG_QR, 1, lab)), DnsFormatError);
  // No question
  EXPECT_THROW(DnsMessageCodec::parse_query(raw_query(0, 0, lab)), DnsFormatError);
  // Label runs off the end
  EXPECT_THROW(DnsMessageCodec::parse_query(raw_query(0, 1, {9, 'l', 'a', 'b'})), DnsFormatError);
  // Name without type and class
  EXPECT_THROW(DnsMessageCodec::parse_query(raw_query(0, 1, {3, 'l', 'a', 'b', 0})), DnsFormatError);
  // Reserved label type
  EXPECT_THROW(DnsMessageCodec::parse_query(raw_query(0, 1, {0x40, 'a', 0, 0x00, 0x10, 0x00, 0x01})),
               DnsFormatError);

  EXPECT_NO_THROW(DnsMessageCodec::parse_query(raw_query(0, 1, lab)));
}

TEST(DnsMessageTest, CompressionLoopIsRejected) {
  // Question name is a pointer to itself
  auto datagram = raw_query(0, 1, {0xC0, 0x0C, 0x00, 0x10, 0x00, 0x01});
  EXPECT_THROW(DnsMessageCodec::parse_query(datagram), DnsFormatError);
}

TEST(DnsMessageTest, CompressedQuestionNameIsFollowed) {
  // Question name points at a name stored after the fixed fields
  auto datagram = raw_query(0, 1, {0xC0, 0x12, 0x00, 0x10, 0x00, 0x01, 3, 'l', 'a', 'b', 0});
  auto query = DnsMessageCodec::parse_query(datagram);
  EXPECT_EQ(query.question.name, "lab.");
  EXPECT_EQ(query.question.type, DnsMessageCodec::TYPE_TXT);
}

TEST(DnsMessageTest, TxtResponseLayout) {
  auto query = DnsMessageCodec::parse_query(
    DnsMessageCodec::encode_query(0x0102, "lab.", DnsMessageCodec::TYPE_TXT));
  auto datagram = DnsMessageCodec::encode_response(query, ResponseCode::NOERROR, std::string("hi"), 60);

  // Header
  EXPECT_EQ(read_u16_at(datagram, 0), 0x0102);
  uint16_t flags = read_u16_at(datagram, 2);
  EXPECT_TRUE(flags & DnsHeader::FLAG_QR);
  EXPECT_TRUE(flags & DnsHeader::FLAG_AA);
  EXPECT_TRUE(flags & DnsHeader::FLAG_RD);
  EXPECT_EQ(flags & DnsHeader::RCODE_MASK, 0);
  EXPECT_EQ(read_u16_at(datagram, 4), 1);
  EXPECT_EQ(read_u16_at(datagram, 6), 1);

  // Question "\3lab\0" + type + class ends at 21; answer follows
  ASSERT_EQ(datagram.size(), 21u + 12u + 3u);
  EXPECT_EQ(read_u16_at(datagram, 21), 0xC00C);
  EXPECT_EQ(read_u16_at(datagram, 23), DnsMessageCodec::TYPE_TXT);
  EXPECT_EQ(read_u16_at(datagram, 25), DnsMessageCodec::CLASS_IN);
  EXPECT_EQ(read_u16_at(datagram, 27), 0);
  EXPECT_EQ(read_u16_at(datagram, 29), 60);
  EXPECT_EQ(read_u16_at(datagram, 31), 3);
  EXPECT_EQ(datagram[33], 2);
  EXPECT_EQ(datagram[34], 'h');
  EXPECT_EQ(datagram[35], 'i');

  auto response = DnsMessageCodec::parse_response(datagram);
  EXPECT_EQ(response.id, 0x0102);
  EXPECT_EQ(response.rcode, ResponseCode::NOERROR);
  EXPECT_EQ(response.answer_count, 1);
  ASSERT_TRUE(response.txt.has_value());
  EXPECT_EQ(*response.txt, "hi");
}

TEST(DnsMessageTest, LongTxtIsSplitIntoCharacterStrings) {
  const std::string payload(600, 'x');
  auto query = DnsMessageCodec::parse_query(
    DnsMessageCodec::encode_query(7, "chunk0.big.lab.", DnsMessageCodec::TYPE_TXT));
  auto datagram = DnsMessageCodec::encode_response(query, ResponseCode::NOERROR, payload, 60);

  // 255 + 255 + 90, each with a length prefix
  const size_t rdata_length = 600 + 3;
  uint16_t rdlength = read_u16_at(datagram, datagram.size() - rdata_length - 2);
  EXPECT_EQ(rdlength, rdata_length);
  EXPECT_EQ(datagram[datagram.size() - rdata_length], 255);

  auto response = DnsMessageCodec::parse_response(datagram);
  ASSERT_TRUE(response.txt.has_value());
  EXPECT_EQ(*response.txt, payload);
}

TEST(DnsMessageTest, NxdomainCarriesNoAnswer) {
  auto query = DnsMessageCodec::parse_query(
    DnsMessageCodec::encode_query(99, "meta.nope.lab.", DnsMessageCodec::TYPE_TXT));
  auto datagram = DnsMessageCodec::encode_response(query, ResponseCode::NXDOMAIN, std::nullopt, 60);

  EXPECT_EQ(read_u16_at(datagram, 6), 0);
  auto response = DnsMessageCodec::parse_response(datagram);
  EXPECT_EQ(response.id, 99);
  EXPECT_EQ(response.rcode, ResponseCode::NXDOMAIN);
  EXPECT_EQ(response.answer_count, 0);
  EXPECT_FALSE(response.txt.has_value());

  // A payload is never attached to a negative answer
  auto with_text = DnsMessageCodec::encode_response(query, ResponseCode::NXDOMAIN, std::string("x"), 60);
  EXPECT_EQ(with_text, datagram);
}

TEST(DnsMessageTest, OpcodeIsEchoed) {
  auto query = DnsMessageCodec::parse_query(raw_query(0x0800, 1, {3, 'l', 'a', 'b', 0, 0x00, 0x10, 0x00, 0x01}));
  auto datagram = DnsMessageCodec::encode_response(query, ResponseCode::NOERROR, std::string("x"), 0);
  uint16_t flags = read_u16_at(datagram, 2);
  EXPECT_EQ(flags & DnsHeader::OPCODE_MASK, 0x0800);
  EXPECT_FALSE(flags & DnsHeader::FLAG_RD);
}

TEST(DnsMessageTest, ParseResponseRejectsQueries) {
  auto datagram = DnsMessageCodec::encode_query(1, "lab.", DnsMessageCodec::TYPE_TXT);
  EXPECT_THROW(DnsMessageCodec::parse_response(datagram), DnsFormatError);
}

TEST(DnsMessageTest, TruncatedResponseIsRejected) {
  auto query = DnsMessageCodec::parse_query(
    DnsMessageCodec::encode_query(5, "lab.", DnsMessageCodec::TYPE_TXT));
  auto datagram = DnsMessageCodec::encode_response(query, ResponseCode::NOERROR, std::string("hello"), 60);
  datagram.resize(datagram.size() - 3);
  EXPECT_THROW(DnsMessageCodec::parse_response(datagram), DnsFormatError);
}

TEST(DnsMessageTest, ResponseCodeNames) {
  EXPECT_STREQ(to_string(ResponseCode::NOERROR), "NOERROR");
  EXPECT_STREQ(to_string(ResponseCode::NXDOMAIN), "NXDOMAIN");
  EXPECT_STREQ(to_string(ResponseCode::REFUSED), "REFUSED");
}
