#include "client/fetcher.hpp"
#include "crypto/digest.hpp"
#include "protocol/chunk_codec.hpp"
#include "protocol/name_codec.hpp"
#include "protocol/protocol_error.hpp"
#include <boost/log/trivial.hpp>

namespace dnsfs {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Fetcher::Fetcher(network::Transport& transport, const std::string& zone)
  : transport_(transport)
  , zone_(protocol::normalize_zone(zone)) {
  BOOST_LOG_TRIVIAL(debug) << "Fetcher: Using zone " << zone_;
}


//==============================================
// FETCH
//==============================================

protocol::Bytes Fetcher::fetch(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Fetcher: Fetching " << name;

  try {
    // Metadata first; transport errors propagate untouched
    const std::string meta_text = transport_.query_txt(meta_query_name(name));

    const protocol::Metadata metadata = protocol::MetadataCodec::parse(meta_text);
    if (metadata.encoding != protocol::Encoding::BASE64) {
      throw protocol::ProtocolError("unsupported encoding in metadata \"" + meta_text + "\"");
    }

    BOOST_LOG_TRIVIAL(info) << "Fetcher: " << name << " has " << metadata.chunk_count << " chunks";

    // One chunk at a time, ascending; the first failure aborts
    protocol::ChunkSequence chunks;
    for (uint64_t index = 0; index < metadata.chunk_count; ++index) {
      chunks.push_back(transport_.query_txt(chunk_query_name(name, index)));
      BOOST_LOG_TRIVIAL(debug) << "Fetcher: Received chunk " << index << " of " << metadata.chunk_count
                               << " (" << chunks.back().size() << " chars)";
    }

    protocol::Bytes data = protocol::ChunkCodec::decode(chunks);
    verify(data, metadata, name);

    BOOST_LOG_TRIVIAL(info) << "Fetcher: Fetched and verified " << data.size() << " bytes for " << name;
    return data;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Fetcher: Fetch of " << name << " aborted: " << e.what();
    throw;
  }
}


//==============================================
// QUERY NAMES
//==============================================

std::string Fetcher::meta_query_name(const std::string& name) const {
  return "meta." + name + "." + zone_;
}

std::string Fetcher::chunk_query_name(const std::string& name, uint64_t index) const {
  return "chunk" + std::to_string(index) + "." + name + "." + zone_;
}


//==============================================
// VERIFICATION
//==============================================

void Fetcher::verify(const protocol::Bytes& data, const protocol::Metadata& metadata,
                     const std::string& name) {
  if (metadata.byte_length && *metadata.byte_length != 0 && data.size() != *metadata.byte_length) {
    throw protocol::IntegrityError("size mismatch for " + name + ": got " + std::to_string(data.size()) +
                                   " expected " + std::to_string(*metadata.byte_length));
  }

  if (metadata.digest && !metadata.digest->empty()) {
    const std::string actual = crypto::sha256_hex(data);
    if (actual != *metadata.digest) {
      throw protocol::IntegrityError("sha256 mismatch for " + name + " (data corrupted or out of order)");
    }
  }
}

} // namespace client
} // namespace dnsfs
