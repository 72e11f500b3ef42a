#ifndef DNSFS_LOGGER_HPP
#define DNSFS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <optional>
#include <string>

namespace dnsfs {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Upper-case name of a severity level
const char* severity_name(severity_level level);

// Maps "trace".."fatal" (case-insensitive) to a severity level
std::optional<severity_level> parse_severity(const std::string& name);

// Initialize logging system with a file sink and a global severity filter
void init_logging(const std::string& log_file,
                  severity_level min_level = severity_level::info);

// Console sink used by tests and interactive tools
void init_console_logging(severity_level min_level = severity_level::warning);

} // namespace logging
} // namespace dnsfs

#endif // DNSFS_LOGGER_HPP
