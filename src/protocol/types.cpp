#include "protocol/types.hpp"

namespace dnsfs {
namespace protocol {

const char* to_string(ReplyStatus status) {
  switch (status) {
    case ReplyStatus::OK: return "OK";
    case ReplyStatus::NOT_FOUND: return "NOT_FOUND";
    default: return "UNKNOWN";
  }
}

} // namespace protocol
} // namespace dnsfs
