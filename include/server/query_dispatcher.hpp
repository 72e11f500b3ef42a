#ifndef DNSFS_SERVER_QUERY_DISPATCHER_HPP
#define DNSFS_SERVER_QUERY_DISPATCHER_HPP

#include <optional>
#include <string>
#include "protocol/types.hpp"
#include "protocol/chunk_codec.hpp"
#include "store/store.hpp"

namespace dnsfs {
namespace server {

// Why a query got the reply it got. Never leaves the process.
enum class DispatchOutcome : uint8_t {
  WELCOME,
  METADATA,
  CHUNK,
  ZONE_MISMATCH,
  WRONG_RECORD_TYPE,
  UNKNOWN_ROUTE,
  MALFORMED_INDEX,
  FILE_NOT_FOUND,
  INDEX_OUT_OF_RANGE,
  STORAGE_FAILURE
};

const char* to_string(DispatchOutcome outcome);

struct DispatchResult {
  DispatchOutcome outcome;
  protocol::Reply reply;
};

// Query -> reply mapping for the dnsfs zone:
//   <zone>                  welcome text
//   meta.<name>.<zone>      chunk count, encoding, digest, length
//   chunk<N>.<name>.<zone>  N-th base64 chunk
// Holds no mutable state; every answer is recomputed from storage, so
// dispatch() may run concurrently on any number of threads.
class QueryDispatcher {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  QueryDispatcher(const store::FileSource& files, const std::string& zone,
                  size_t chunk_width = protocol::DEFAULT_CHUNK_WIDTH);


  // ---- DISPATCH ----
  DispatchResult dispatch(const protocol::Query& query) const;


  // ---- GETTERS ----
  const std::string& zone() const { return zone_; }
  const std::string& welcome_text() const { return welcome_; }
  size_t chunk_width() const { return codec_.width(); }

private:
  // ---- PARAMETERS ----
  const store::FileSource& files_;
  std::string zone_;
  std::string welcome_;
  protocol::ChunkCodec codec_;


  // ---- HANDLERS ----
  DispatchResult handle_meta(const std::string& raw_name) const;
  DispatchResult handle_chunk(const std::string& index_part, const std::string& raw_name) const;


  // ---- UTILITY METHODS ----
  // Tries name, name.bin, name.txt; first hit wins
  std::optional<protocol::Bytes> resolve_file(const std::string& name) const;
  static DispatchResult negative(DispatchOutcome outcome);
};

} // namespace server
} // namespace dnsfs

#endif // DNSFS_SERVER_QUERY_DISPATCHER_HPP
