#pragma once

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "cas/responder.hpp"
#include "network/tcp_session.hpp"

namespace stubcas {
namespace network {

class TCP_Server {
public:
  // Delete copy constructor and assignment operator
  TCP_Server(const TCP_Server&) = delete;
  TCP_Server& operator=(const TCP_Server&) = delete;


  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see bound_port()
  TCP_Server(const uint16_t port, const std::string& address, cas::Responder& responder);
  ~TCP_Server();


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  const std::string& address() const { return address_; }
  // Actual listening port, 0 until the listener is started
  uint16_t bound_port() const { return bound_port_; }
  // Number of connections still being served
  std::size_t session_count() const;

private:
  // ---- PARAMETERS ----
  // Network Parameters
  const uint16_t port_;
  const std::string address_;
  std::atomic<uint16_t> bound_port_{0};

  // System components
  cas::Responder& responder_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  std::atomic<bool> is_running_{false};

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Live connections and access mutex
  std::vector<std::shared_ptr<TCP_Session>> sessions_;
  mutable std::mutex sessions_mutex_;


  // ---- LISTENER LIFECYCLE ----
  // Binds the acceptor, throws on failure
  void open_acceptor();
  void run_io_context();
  void close_acceptor();
  // Closes every connection and joins its thread
  void stop_sessions();


  // ---- CONNECTION HANDLING ----
  // Re-arms itself after each accepted connection
  void start_accept();
  // Starts a session for an accepted socket
  void create_session(boost::asio::ip::tcp::socket socket);
  // Drops sessions whose peer has gone away
  void prune_sessions();
};

} // namespace network
} // namespace stubcas
