#include "network/loopback_transport.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnsfs {
namespace network {

LoopbackTransport::LoopbackTransport(const server::QueryDispatcher& dispatcher)
  : dispatcher_(dispatcher) {}

std::string LoopbackTransport::query_txt(const std::string& qualified_name) {
  history_.push_back(qualified_name);

  protocol::Query query{qualified_name, static_cast<uint16_t>(protocol::RecordType::TXT)};
  auto result = dispatcher_.dispatch(query);
  BOOST_LOG_TRIVIAL(trace) << "Loopback transport: " << qualified_name << " -> "
                           << server::to_string(result.outcome) << " ("
                           << protocol::to_string(result.reply.status) << ")";

  if (result.reply.status != protocol::ReplyStatus::OK) {
    throw protocol::NotFoundError(qualified_name);
  }
  if (!result.reply.payload || result.reply.payload->empty()) {
    throw protocol::TransportError("empty answer for " + qualified_name);
  }
  return *result.reply.payload;
}

} // namespace network
} // namespace dnsfs
