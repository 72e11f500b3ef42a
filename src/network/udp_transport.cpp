#include "network/udp_transport.hpp"
#include "network/dns_message.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnsfs {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UDP_Transport::UDP_Transport(const std::string& address, uint16_t port,
                             std::chrono::milliseconds timeout)
  : socket_(io_context_)
  , timeout_(timeout)
  , id_generator_(std::random_device{}()) {
  try {
    server_endpoint_ = boost::asio::ip::udp::endpoint(boost::asio::ip::make_address(address), port);
    socket_.open(server_endpoint_.protocol());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP transport: Failed to set up socket for " << address << ":" << port
                             << ": " << e.what();
    throw protocol::TransportError("cannot reach " + address + ":" + std::to_string(port) + ": " + e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "UDP transport: Targeting " << server_endpoint_
                          << " with timeout " << timeout_.count() << "ms";
}

UDP_Transport::~UDP_Transport() {
  boost::system::error_code ec;
  socket_.close(ec);
}


//==============================================
// QUERIES
//==============================================

std::string UDP_Transport::query_txt(const std::string& qualified_name) {
  const uint16_t id = next_id();

  std::vector<uint8_t> request;
  try {
    request = DnsMessageCodec::encode_query(id, qualified_name, DnsMessageCodec::TYPE_TXT);
  } catch (const DnsFormatError& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP transport: Cannot encode query for " << qualified_name << ": " << e.what();
    throw protocol::ProtocolError("invalid query name \"" + qualified_name + "\": " + e.what());
  }

  boost::system::error_code ec;
  socket_.send_to(boost::asio::buffer(request), server_endpoint_, 0, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "UDP transport: Send failed for " << qualified_name << ": " << ec.message();
    throw protocol::TransportError("send failed for " + qualified_name + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "UDP transport: Sent query id " << id << " for " << qualified_name;

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  while (true) {
    auto datagram = receive_until(deadline);
    if (!datagram) {
      BOOST_LOG_TRIVIAL(error) << "UDP transport: Timed out after " << timeout_.count()
                               << "ms waiting for " << qualified_name;
      throw protocol::TransportError("timed out waiting for " + qualified_name);
    }

    DnsResponse response;
    try {
      response = DnsMessageCodec::parse_response(*datagram);
    } catch (const DnsFormatError& e) {
      BOOST_LOG_TRIVIAL(warning) << "UDP transport: Ignoring malformed response: " << e.what();
      continue;
    }

    // Stale answer to an earlier query
    if (response.id != id) {
      BOOST_LOG_TRIVIAL(debug) << "UDP transport: Ignoring response id " << response.id
                               << " while waiting for " << id;
      continue;
    }

    if (response.rcode == ResponseCode::NXDOMAIN) {
      BOOST_LOG_TRIVIAL(debug) << "UDP transport: NXDOMAIN for " << qualified_name;
      throw protocol::NotFoundError(qualified_name);
    }
    if (response.rcode != ResponseCode::NOERROR) {
      throw protocol::TransportError(std::string("server answered ") + to_string(response.rcode) +
                                     " for " + qualified_name);
    }
    if (!response.txt || response.txt->empty()) {
      throw protocol::TransportError("empty answer for " + qualified_name);
    }
    return *response.txt;
  }
}


//==============================================
// DATAGRAM I/O
//==============================================

std::optional<std::vector<uint8_t>> UDP_Transport::receive_until(std::chrono::steady_clock::time_point deadline) {
  while (std::chrono::steady_clock::now() < deadline) {
    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    boost::asio::ip::udp::endpoint sender;
    boost::system::error_code result = boost::asio::error::would_block;
    std::size_t received = 0;

    socket_.async_receive_from(boost::asio::buffer(buffer), sender,
      [&result, &received](const boost::system::error_code& error, std::size_t bytes) {
        result = error;
        received = bytes;
      });

    io_context_.restart();
    io_context_.run_until(deadline);

    if (result == boost::asio::error::would_block) {
      // Deadline hit; cancel and drain the aborted handler
      boost::system::error_code ignored;
      socket_.cancel(ignored);
      io_context_.restart();
      io_context_.run();
      return std::nullopt;
    }

    if (result) {
      BOOST_LOG_TRIVIAL(error) << "UDP transport: Receive failed: " << result.message();
      throw protocol::TransportError("receive failed: " + result.message());
    }

    if (sender != server_endpoint_) {
      BOOST_LOG_TRIVIAL(debug) << "UDP transport: Ignoring datagram from " << sender;
      continue;
    }

    buffer.resize(received);
    return buffer;
  }
  return std::nullopt;
}

uint16_t UDP_Transport::next_id() {
  std::uniform_int_distribution<uint32_t> distribution(0, 0xFFFF);
  return static_cast<uint16_t>(distribution(id_generator_));
}

} // namespace network
} // namespace dnsfs
