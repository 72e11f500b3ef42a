#ifndef DNSFS_NETWORK_UDP_TRANSPORT_HPP
#define DNSFS_NETWORK_UDP_TRANSPORT_HPP

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "network/transport.hpp"
#include "protocol/types.hpp"

namespace dnsfs {
namespace network {

// One TXT query per datagram against a fixed server endpoint.
// Blocking; not safe to share between threads.
class UDP_Transport : public Transport {
public:
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{2000};
  static constexpr size_t MAX_DATAGRAM_SIZE = protocol::MAX_DATAGRAM_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  UDP_Transport(const std::string& address, uint16_t port,
                std::chrono::milliseconds timeout = DEFAULT_TIMEOUT);
  ~UDP_Transport() override;


  // ---- QUERIES ----
  std::string query_txt(const std::string& qualified_name) override;

private:
  // ---- PARAMETERS ----
  boost::asio::io_context io_context_;
  boost::asio::ip::udp::endpoint server_endpoint_;
  boost::asio::ip::udp::socket socket_;
  std::chrono::milliseconds timeout_;
  std::mt19937 id_generator_;


  // ---- DATAGRAM I/O ----
  // Next datagram from the server endpoint, nullopt once deadline passes
  std::optional<std::vector<uint8_t>> receive_until(std::chrono::steady_clock::time_point deadline);
  uint16_t next_id();
};

} // namespace network
} // namespace dnsfs

#endif // DNSFS_NETWORK_UDP_TRANSPORT_HPP
