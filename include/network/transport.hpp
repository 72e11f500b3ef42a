#ifndef DNSFS_NETWORK_TRANSPORT_HPP
#define DNSFS_NETWORK_TRANSPORT_HPP

#include <string>

namespace dnsfs {
namespace network {

// "Send a text query, get a text answer or failure"
class Transport {
public:
    virtual ~Transport() = default;

    // TXT payload answering qualified_name.
    // Throws protocol::NotFoundError on a negative reply and
    // protocol::TransportError on timeout, empty answer or I/O failure.
    virtual std::string query_txt(const std::string& qualified_name) = 0;

protected:
    Transport() = default;
};

} // namespace network
} // namespace dnsfs

#endif // DNSFS_NETWORK_TRANSPORT_HPP
