#ifndef DNSFS_PROTOCOL_ERROR_HPP
#define DNSFS_PROTOCOL_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dnsfs {
namespace protocol {

class DnsfsError : public std::runtime_error {
public:
  explicit DnsfsError(const std::string& message) 
    : std::runtime_error(message) {}
};

// No answer, timeout, empty payload or socket failure
class TransportError : public DnsfsError {
public:
  explicit TransportError(const std::string& message) 
    : DnsfsError("Transport error: " + message) {}
};

// Explicit negative status from the server
class NotFoundError : public TransportError {
public:
  explicit NotFoundError(const std::string& name) 
    : TransportError("no record for " + name) {}
};

class ProtocolError : public DnsfsError {
public:
  explicit ProtocolError(const std::string& message) 
    : DnsfsError("Protocol error: " + message) {}
};

class MalformedMetadata : public ProtocolError {
public:
  explicit MalformedMetadata(const std::string& message) 
    : ProtocolError("malformed metadata: " + message) {}
};

// Decoded size or digest does not match the served metadata
class IntegrityError : public DnsfsError {
public:
  explicit IntegrityError(const std::string& message) 
    : DnsfsError("Integrity error: " + message) {}
};

} // namespace protocol
} // namespace dnsfs

#endif // DNSFS_PROTOCOL_ERROR_HPP
