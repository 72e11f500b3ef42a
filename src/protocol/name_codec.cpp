#include "protocol/name_codec.hpp"
#include <cctype>

namespace dnsfs {
namespace protocol {

std::string sanitize_name(const std::string& raw) {
  std::string result;
  result.reserve(raw.size());

  for (unsigned char c : raw) {
    char lowered = static_cast<char>(std::tolower(c));
    if ((lowered >= 'a' && lowered <= 'z') || (lowered >= '0' && lowered <= '9') ||
        lowered == '-' || lowered == '_') {
      result.push_back(lowered);
    }
  }
  return result;
}

std::string normalize_zone(const std::string& zone) {
  std::string result;
  result.reserve(zone.size() + 1);

  for (unsigned char c : zone) {
    result.push_back(static_cast<char>(std::tolower(c)));
  }

  // Collapse any run of trailing dots into one
  while (!result.empty() && result.back() == '.') {
    result.pop_back();
  }
  result.push_back('.');
  return result;
}

} // namespace protocol
} // namespace dnsfs
