#ifndef DNSFS_SERVER_DNS_SERVER_HPP
#define DNSFS_SERVER_DNS_SERVER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "network/udp_server.hpp"
#include "server/query_dispatcher.hpp"

namespace dnsfs {
namespace server {

struct DnsServerConfig {
  std::string address = "127.0.0.1";
  uint16_t port = 5353;
  size_t worker_threads = 2;
  uint32_t ttl = 60;
};

// Authoritative UDP front end for a QueryDispatcher
class DnsServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DnsServer(const DnsServerConfig& config, const QueryDispatcher& dispatcher);
  ~DnsServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start();
  void shutdown();


  // ---- DATAGRAM PROCESSING ----
  // Decode, dispatch, encode. nullopt when the datagram is not a parseable query.
  std::optional<std::vector<uint8_t>> handle_datagram(const std::vector<uint8_t>& datagram) const;


  // ---- GETTERS ----
  uint16_t local_port() const { return udp_server_->local_port(); }

private:
  // ---- PARAMETERS ----
  DnsServerConfig config_;
  const QueryDispatcher& dispatcher_;
  std::unique_ptr<network::UDP_Server> udp_server_;
};

} // namespace server
} // namespace dnsfs

#endif // DNSFS_SERVER_DNS_SERVER_HPP
