#include "server/dns_server.hpp"
#include "network/dns_message.hpp"
#include <boost/log/trivial.hpp>

namespace dnsfs {
namespace server {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DnsServer::DnsServer(const DnsServerConfig& config, const QueryDispatcher& dispatcher)
  : config_(config)
  , dispatcher_(dispatcher)
  , udp_server_(std::make_unique<network::UDP_Server>(config.port, config.address, config.worker_threads)) {
  udp_server_->set_handler([this](const std::vector<uint8_t>& datagram) {
    return handle_datagram(datagram);
  });
  BOOST_LOG_TRIVIAL(info) << "DNS server: Created for zone " << dispatcher_.zone()
                          << " on " << config_.address << ":" << config_.port;
}

DnsServer::~DnsServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool DnsServer::start() {
  if (!udp_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "DNS server: Failed to start UDP listener";
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "DNS server: Listening on " << config_.address << ":" << local_port();
  return true;
}

void DnsServer::shutdown() {
  udp_server_->shutdown();
}


//==============================================
// DATAGRAM PROCESSING
//==============================================

std::optional<std::vector<uint8_t>> DnsServer::handle_datagram(const std::vector<uint8_t>& datagram) const {
  network::DnsQuery query;
  try {
    query = network::DnsMessageCodec::parse_query(datagram);
  } catch (const network::DnsFormatError& e) {
    BOOST_LOG_TRIVIAL(warning) << "DNS server: Dropping malformed datagram (" << datagram.size()
                               << " bytes): " << e.what();
    return std::nullopt;
  }

  protocol::Query request{query.question.name, query.question.type};
  DispatchResult result = dispatcher_.dispatch(request);

  BOOST_LOG_TRIVIAL(debug) << "DNS server: " << query.question.name << " type " << query.question.type
                           << " -> " << to_string(result.outcome);

  // The wire only ever sees NOERROR with one answer or NXDOMAIN
  const bool ok = result.reply.status == protocol::ReplyStatus::OK;
  try {
    return network::DnsMessageCodec::encode_response(
      query,
      ok ? network::ResponseCode::NOERROR : network::ResponseCode::NXDOMAIN,
      ok ? result.reply.payload : std::nullopt,
      config_.ttl);
  } catch (const network::DnsFormatError& e) {
    BOOST_LOG_TRIVIAL(error) << "DNS server: Failed to encode reply for " << query.question.name
                             << ": " << e.what();
    return std::nullopt;
  }
}

} // namespace server
} // namespace dnsfs
