#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include "logger/logger.hpp"
#include "protocol/types.hpp"

namespace dnsfs {
namespace config {

struct ServerOptions {
  std::string address{"127.0.0.1"};
  uint16_t port{5353};
  std::string zone{protocol::DEFAULT_ZONE};
  std::string store_root{"store"};
  size_t chunk_width{protocol::DEFAULT_CHUNK_WIDTH};
  size_t worker_threads{2};
  uint32_t ttl{60};
  std::string log_file{"dnsfs_server.log"};
  logging::severity_level log_level{logging::severity_level::info};
  bool valid{false};
};

struct ClientOptions {
  std::string name;
  std::string address{"127.0.0.1"};
  uint16_t port{5353};
  std::string zone{protocol::DEFAULT_ZONE};
  std::chrono::milliseconds timeout{2000};
  // Defaults to retrieved_<name>.bin
  std::string output;
  std::string log_file{"dnsfs_fetch.log"};
  logging::severity_level log_level{logging::severity_level::info};
  bool valid{false};
};

// Flags come in "-x <value>" / "--long <value>" pairs. On any error the
// message and usage go to err and the result has valid == false.
ServerOptions parse_server_options(int argc, const char* const argv[], std::ostream& err);
ClientOptions parse_client_options(int argc, const char* const argv[], std::ostream& err);

void print_server_usage(const std::string& program_name, std::ostream& out);
void print_client_usage(const std::string& program_name, std::ostream& out);

} // namespace config
} // namespace dnsfs
