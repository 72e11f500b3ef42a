#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "protocol/types.hpp"

namespace dnsfs {
namespace network {

class UDP_Server {
public:
  // Maps one request datagram to an optional reply datagram
  using DatagramHandler = std::function<std::optional<std::vector<uint8_t>>(const std::vector<uint8_t>&)>;

  static constexpr size_t MAX_DATAGRAM_SIZE = protocol::MAX_DATAGRAM_SIZE;


  // -- CONSTRUCTOR AND DESTRUCTOR ----
  UDP_Server(const uint16_t port, const std::string& address, size_t worker_threads = 1);
  ~UDP_Server();

  UDP_Server(const UDP_Server&) = delete;
  UDP_Server& operator=(const UDP_Server&) = delete;

  
  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds, starts receiving and spins up the worker threads
  bool start_listener();
  void shutdown();


  // ---- GETTERS AND SETTERS ----
  // Must be set before start_listener()
  void set_handler(DatagramHandler handler);
  bool is_running() const { return is_running_; }
  // Port actually bound; differs from the requested one when that was 0
  uint16_t local_port() const;

private:

  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  const size_t worker_threads_;

  // Server state
  std::vector<std::thread> io_threads_;
  std::atomic<bool> is_running_;
  uint16_t bound_port_;
  
  // Incoming datagram handlers; socket operations are serialized on strand_
  using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<Strand> strand_;
  std::unique_ptr<boost::asio::ip::udp::socket> socket_;
  DatagramHandler handler_;

  
  // ---- DATAGRAM PROCESSING ----
  // Arms the next asynchronous receive
  void start_receive();
  // Runs the handler and sends its reply back to the sender
  void handle_datagram(std::shared_ptr<std::vector<uint8_t>> datagram,
                       std::shared_ptr<boost::asio::ip::udp::endpoint> sender);
};

} // namespace network
} // namespace dnsfs
