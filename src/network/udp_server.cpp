#include "network/udp_server.hpp"
#include <boost/log/trivial.hpp>

namespace dnsfs {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

UDP_Server::UDP_Server(const uint16_t port, const std::string& address, size_t worker_threads)
  : port_(port)
  , address_(address)
  , worker_threads_(worker_threads == 0 ? 1 : worker_threads)
  , is_running_(false)
  , bound_port_(port) {
  BOOST_LOG_TRIVIAL(info) << "UDP server: Initializing UDP server on " << address << ":" << port
                          << " with " << worker_threads_ << " worker threads";
}

UDP_Server::~UDP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool UDP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "UDP server: Server already running";
    return false;
  }

  if (!handler_) {
    BOOST_LOG_TRIVIAL(error) << "UDP server: No datagram handler set";
    return false;
  }

  try {
    io_context_ = std::make_unique<boost::asio::io_context>();
    strand_ = std::make_unique<Strand>(boost::asio::make_strand(*io_context_));

    // Create endpoint and bind socket
    boost::asio::ip::udp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );
    socket_ = std::make_unique<boost::asio::ip::udp::socket>(*io_context_, endpoint);
    bound_port_ = socket_->local_endpoint().port();
    BOOST_LOG_TRIVIAL(debug) << "UDP server: Socket bound to " << address_ << ":" << bound_port_;

    is_running_ = true;

    // Start receiving datagrams
    boost::asio::post(*strand_, [this]() { start_receive(); });

    // Run io_context on the worker threads
    for (size_t i = 0; i < worker_threads_; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          boost::asio::io_context::work work(*io_context_);
          io_context_->run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "UDP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "UDP server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP server: Failed to start server: " << e.what();
    is_running_ = false;
    socket_.reset();
    strand_.reset();
    io_context_.reset();
    return false;
  }
}

void UDP_Server::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "UDP server: Initiating server shutdown";

  is_running_ = false;

  // Stop io_context and wait for the workers to finish
  io_context_->stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Close the socket now that no handler can touch it
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "UDP server: Error closing socket: " << ec.message();
    }
  }
  socket_.reset();
  strand_.reset();
  io_context_.reset();

  BOOST_LOG_TRIVIAL(info) << "UDP server: Server shutdown complete";
}


//==============================================
// DATAGRAM PROCESSING
//==============================================

// Runs on the strand; the socket is only ever touched from there
void UDP_Server::start_receive() {
  if (!socket_ || !is_running_) {
    return;
  }

  auto datagram = std::make_shared<std::vector<uint8_t>>(MAX_DATAGRAM_SIZE);
  auto sender = std::make_shared<boost::asio::ip::udp::endpoint>();

  socket_->async_receive_from(boost::asio::buffer(*datagram), *sender,
    boost::asio::bind_executor(*strand_,
      [this, datagram, sender](const boost::system::error_code& error, std::size_t bytes) {
        if (error) {
          if (error == boost::asio::error::operation_aborted || !is_running_) {
            return;
          }
          BOOST_LOG_TRIVIAL(error) << "UDP server: Receive error: " << error.message();
          start_receive();
          return;
        }

        datagram->resize(bytes);
        BOOST_LOG_TRIVIAL(trace) << "UDP server: Received " << bytes << " bytes from " << *sender;

        // Re-arm first so other workers can take the next datagram while this one is handled
        start_receive();
        boost::asio::post(*io_context_, [this, datagram, sender]() {
          handle_datagram(datagram, sender);
        });
      }));
}

void UDP_Server::handle_datagram(std::shared_ptr<std::vector<uint8_t>> datagram,
                                 std::shared_ptr<boost::asio::ip::udp::endpoint> sender) {
  std::optional<std::vector<uint8_t>> reply;
  try {
    reply = handler_(*datagram);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "UDP server: Handler failed for datagram from " << *sender << ": " << e.what();
    return;
  }

  if (!reply) {
    BOOST_LOG_TRIVIAL(debug) << "UDP server: No reply for datagram from " << *sender;
    return;
  }

  auto response = std::make_shared<std::vector<uint8_t>>(std::move(*reply));
  boost::asio::post(*strand_, [this, response, sender]() {
    if (!socket_ || !is_running_) {
      return;
    }
    socket_->async_send_to(boost::asio::buffer(*response), *sender,
      boost::asio::bind_executor(*strand_,
        [response, sender](const boost::system::error_code& error, std::size_t bytes) {
          if (error) {
            BOOST_LOG_TRIVIAL(error) << "UDP server: Failed to send reply to " << *sender << ": " << error.message();
            return;
          }
          BOOST_LOG_TRIVIAL(trace) << "UDP server: Sent " << bytes << " bytes to " << *sender;
        }));
  });
}


//==============================================
// GETTERS AND SETTERS
//==============================================

void UDP_Server::set_handler(DatagramHandler handler) {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "UDP server: Ignoring handler change while running";
    return;
  }
  handler_ = std::move(handler);
}

uint16_t UDP_Server::local_port() const {
  return bound_port_;
}

} // namespace network
} // namespace dnsfs
