#ifndef DNSFS_CLIENT_FETCHER_HPP
#define DNSFS_CLIENT_FETCHER_HPP

#include <string>
#include "network/transport.hpp"
#include "protocol/metadata_codec.hpp"
#include "protocol/types.hpp"

namespace dnsfs {
namespace client {

// Reassembles one file from meta.<name>.<zone> and chunk<i>.<name>.<zone>.
// Strictly sequential: one outstanding query, indices ascending. Any failure
// throws and discards everything retrieved so far; there is no retry.
class Fetcher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Fetcher(network::Transport& transport, const std::string& zone);


  // ---- FETCH ----
  // Verified file contents. Throws:
  //   protocol::NotFoundError   server has no such file (or chunk)
  //   protocol::TransportError  timeout, empty answer, I/O failure
  //   protocol::ProtocolError   malformed metadata, unknown encoding, bad base64
  //   protocol::IntegrityError  length or SHA-256 mismatch
  protocol::Bytes fetch(const std::string& name);


  // ---- QUERY NAMES ----
  std::string meta_query_name(const std::string& name) const;
  std::string chunk_query_name(const std::string& name, uint64_t index) const;

private:
  // ---- PARAMETERS ----
  network::Transport& transport_;
  std::string zone_;


  // ---- VERIFICATION ----
  static void verify(const protocol::Bytes& data, const protocol::Metadata& metadata,
                     const std::string& name);
};

} // namespace client
} // namespace dnsfs

#endif // DNSFS_CLIENT_FETCHER_HPP
