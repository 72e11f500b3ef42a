#include "config/options.hpp"
#include "protocol/name_codec.hpp"
#include <charconv>
#include <limits>
#include <optional>

namespace dnsfs {
namespace config {

namespace {

template <typename T>
std::optional<T> parse_number(const std::string& value) {
  T result{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return result;
}

std::optional<uint16_t> parse_port(const std::string& value) {
  auto port = parse_number<uint32_t>(value);
  if (!port || *port == 0 || *port > std::numeric_limits<uint16_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*port);
}

std::optional<size_t> parse_positive(const std::string& value) {
  auto number = parse_number<size_t>(value);
  if (!number || *number == 0) {
    return std::nullopt;
  }
  return number;
}

// Lowercase with a single trailing dot; nullopt when nothing but dots remain
std::optional<std::string> parse_zone(const std::string& value) {
  std::string zone = protocol::normalize_zone(value);
  if (zone == ".") {
    return std::nullopt;
  }
  return zone;
}

bool is_flag(const std::string& flag, const char* short_name, const char* long_name) {
  return flag == short_name || flag == long_name;
}

} // namespace


//==============================================
// SERVER OPTIONS
//==============================================

void print_server_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " [options]\n"
      << "Options:\n"
      << "  -a, --address <ip>     Bind address (default 127.0.0.1)\n"
      << "  -p, --port <port>      Bind port (default 5353)\n"
      << "  -z, --zone <zone>      Zone suffix (default lab.)\n"
      << "  -s, --store <dir>      Storage root directory (default store)\n"
      << "  -w, --width <chars>    Chunk width in base64 characters, 1..3600 (default 180)\n"
      << "  -t, --threads <n>      Worker threads (default 2)\n"
      << "      --ttl <seconds>    Answer TTL (default 60)\n"
      << "  -l, --log-file <path>  Log file (default dnsfs_server.log)\n"
      << "  -v, --log-level <lvl>  trace|debug|info|warning|error|fatal (default info)\n"
      << "Example: " << program_name << " -a 127.0.0.1 -p 5353 -s ./store\n";
}

ServerOptions parse_server_options(int argc, const char* const argv[], std::ostream& err) {
  ServerOptions options;
  const std::string program = argc > 0 ? argv[0] : "dnsfs_server";

  auto fail = [&](const std::string& message) {
    err << "Error: " << message << '\n';
    print_server_usage(program, err);
    options.valid = false;
    return options;
  };

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);
    if (i + 1 >= argc) {
      return fail("Missing value for " + flag);
    }
    const std::string value(argv[i + 1]);

    if (is_flag(flag, "-a", "--address")) {
      options.address = value;
    } else if (is_flag(flag, "-p", "--port")) {
      auto port = parse_port(value);
      if (!port) return fail("Invalid port number: " + value);
      options.port = *port;
    } else if (is_flag(flag, "-z", "--zone")) {
      auto zone = parse_zone(value);
      if (!zone) return fail("Invalid zone: " + value);
      options.zone = *zone;
    } else if (is_flag(flag, "-s", "--store")) {
      options.store_root = value;
    } else if (is_flag(flag, "-w", "--width")) {
      auto width = parse_positive(value);
      if (!width || *width > protocol::MAX_CHUNK_WIDTH) {
        return fail("Invalid chunk width: " + value + " (1.." + std::to_string(protocol::MAX_CHUNK_WIDTH) + ")");
      }
      options.chunk_width = *width;
    } else if (is_flag(flag, "-t", "--threads")) {
      auto threads = parse_positive(value);
      if (!threads) return fail("Invalid thread count: " + value);
      options.worker_threads = *threads;
    } else if (flag == "--ttl") {
      auto ttl = parse_number<uint32_t>(value);
      if (!ttl) return fail("Invalid TTL: " + value);
      options.ttl = *ttl;
    } else if (is_flag(flag, "-l", "--log-file")) {
      options.log_file = value;
    } else if (is_flag(flag, "-v", "--log-level")) {
      auto level = logging::parse_severity(value);
      if (!level) return fail("Invalid log level: " + value);
      options.log_level = *level;
    } else {
      return fail("Unknown argument: " + flag);
    }
  }

  if (options.address.empty() || options.store_root.empty()) {
    return fail("Address and store directory must not be empty");
  }

  options.valid = true;
  return options;
}


//==============================================
// CLIENT OPTIONS
//==============================================

void print_client_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " -n <name> [options]\n"
      << "Required arguments:\n"
      << "  -n, --name <name>      Logical file name to fetch\n"
      << "Options:\n"
      << "  -a, --address <ip>     Server address (default 127.0.0.1)\n"
      << "  -p, --port <port>      Server port (default 5353)\n"
      << "  -z, --zone <zone>      Zone suffix (default lab.)\n"
      << "  -t, --timeout <ms>     Per-query timeout in milliseconds (default 2000)\n"
      << "  -o, --output <path>    Output file (default retrieved_<name>.bin)\n"
      << "  -l, --log-file <path>  Log file (default dnsfs_fetch.log)\n"
      << "  -v, --log-level <lvl>  trace|debug|info|warning|error|fatal (default info)\n"
      << "Example: " << program_name << " -n hello -a 127.0.0.1 -p 5353\n";
}

ClientOptions parse_client_options(int argc, const char* const argv[], std::ostream& err) {
  ClientOptions options;
  const std::string program = argc > 0 ? argv[0] : "dnsfs_fetch";

  auto fail = [&](const std::string& message) {
    err << "Error: " << message << '\n';
    print_client_usage(program, err);
    options.valid = false;
    return options;
  };

  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);
    if (i + 1 >= argc) {
      return fail("Missing value for " + flag);
    }
    const std::string value(argv[i + 1]);

    if (is_flag(flag, "-n", "--name")) {
      options.name = value;
    } else if (is_flag(flag, "-a", "--address")) {
      options.address = value;
    } else if (is_flag(flag, "-p", "--port")) {
      auto port = parse_port(value);
      if (!port) return fail("Invalid port number: " + value);
      options.port = *port;
    } else if (is_flag(flag, "-z", "--zone")) {
      auto zone = parse_zone(value);
      if (!zone) return fail("Invalid zone: " + value);
      options.zone = *zone;
    } else if (is_flag(flag, "-t", "--timeout")) {
      auto timeout = parse_positive(value);
      if (!timeout) return fail("Invalid timeout: " + value);
      options.timeout = std::chrono::milliseconds(*timeout);
    } else if (is_flag(flag, "-o", "--output")) {
      options.output = value;
    } else if (is_flag(flag, "-l", "--log-file")) {
      options.log_file = value;
    } else if (is_flag(flag, "-v", "--log-level")) {
      auto level = logging::parse_severity(value);
      if (!level) return fail("Invalid log level: " + value);
      options.log_level = *level;
    } else {
      return fail("Unknown argument: " + flag);
    }
  }

  if (options.name.empty()) {
    return fail("A file name (-n) is required");
  }
  if (options.output.empty()) {
    options.output = "retrieved_" + options.name + ".bin";
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace dnsfs
