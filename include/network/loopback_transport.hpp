#ifndef DNSFS_NETWORK_LOOPBACK_TRANSPORT_HPP
#define DNSFS_NETWORK_LOOPBACK_TRANSPORT_HPP

#include <string>
#include <vector>
#include "network/transport.hpp"
#include "server/query_dispatcher.hpp"

namespace dnsfs {
namespace network {

// Calls a dispatcher in-process, no sockets involved. Meant for tests:
// every query name is kept in history() until clear_history().
class LoopbackTransport : public Transport {
public:
  explicit LoopbackTransport(const server::QueryDispatcher& dispatcher);

  std::string query_txt(const std::string& qualified_name) override;

  // Names queried so far, in order
  const std::vector<std::string>& history() const { return history_; }
  void clear_history() { history_.clear(); }

private:
  const server::QueryDispatcher& dispatcher_;
  std::vector<std::string> history_;
};

} // namespace network
} // namespace dnsfs

#endif // DNSFS_NETWORK_LOOPBACK_TRANSPORT_HPP
