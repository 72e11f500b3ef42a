#ifndef DNSFS_PROTOCOL_NAME_CODEC_HPP
#define DNSFS_PROTOCOL_NAME_CODEC_HPP

#include <string>

namespace dnsfs {
namespace protocol {

// Lowercases and drops every character outside [a-z0-9-_]. Never fails.
// Distinct raw names can collapse to the same identifier ("Hello!" and
// "hello" both become "hello") and then resolve to the same stored file.
std::string sanitize_name(const std::string& raw);

// Lowercased zone with exactly one trailing dot ("LAB" -> "lab.")
std::string normalize_zone(const std::string& zone);

} // namespace protocol
} // namespace dnsfs

#endif // DNSFS_PROTOCOL_NAME_CODEC_HPP
