#include "config/options.hpp"
#include "logger/logger.hpp"
#include "server/dns_server.hpp"
#include "server/query_dispatcher.hpp"
#include "store/store.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>
#include <string>

bool run_server(const dnsfs::config::ServerOptions& options) {
  try {
    dnsfs::store::Store store(options.store_root);

    auto files = store.list();
    BOOST_LOG_TRIVIAL(info) << "Server: Store holds " << files.size() << " files";
    for (const auto& file : files) {
      BOOST_LOG_TRIVIAL(info) << "Server:   " << file;
    }

    dnsfs::server::QueryDispatcher dispatcher(store, options.zone, options.chunk_width);

    dnsfs::server::DnsServerConfig config;
    config.address = options.address;
    config.port = options.port;
    config.worker_threads = options.worker_threads;
    config.ttl = options.ttl;
    dnsfs::server::DnsServer server(config, dispatcher);

    if (!server.start()) {
      std::cerr << "Error: Failed to bind " << options.address << ":" << options.port << '\n';
      return false;
    }

    std::cout << "dnsfs authoritative server\n"
              << "zone: " << dispatcher.zone() << "  bind: " << options.address << ":" << server.local_port()
              << "  store: " << store.base_path().string() << '\n'
              << "running. press enter to stop." << std::endl;

    std::string line;
    std::getline(std::cin, line);

    server.shutdown();
    BOOST_LOG_TRIVIAL(info) << "Server: Stopped";
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Server: " << e.what();
    std::cerr << "Error: Failed to start server: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = dnsfs::config::parse_server_options(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }

  try {
    dnsfs::logging::init_logging(options.log_file, options.log_level);
  } catch (const std::exception&) {
    return 1;
  }

  return run_server(options) ? 0 : 1;
}
