#include "client/fetcher.hpp"
#include "config/options.hpp"
#include "logger/logger.hpp"
#include "network/udp_transport.hpp"
#include "protocol/protocol_error.hpp"
#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <iostream>

int run_fetch(const dnsfs::config::ClientOptions& options) {
  dnsfs::protocol::Bytes data;
  try {
    dnsfs::network::UDP_Transport transport(options.address, options.port, options.timeout);
    dnsfs::client::Fetcher fetcher(transport, options.zone);
    data = fetcher.fetch(options.name);
  } catch (const dnsfs::protocol::DnsfsError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Fetch: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
  }

  try {
    std::filesystem::path output(options.output);
    std::filesystem::path directory = output.has_parent_path() ? output.parent_path() : ".";
    dnsfs::store::Store out_store(directory.string());
    out_store.write(output.filename().string(), data);
    std::cout << "wrote: " << (out_store.base_path() / output.filename()).string() << std::endl;
    return 0;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Fetch: Failed to write output: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
  }
}

int main(int argc, char* argv[]) {
  const auto options = dnsfs::config::parse_client_options(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }

  try {
    dnsfs::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  return run_fetch(options);
}
