#ifndef STUBCAS_NETWORK_TCP_SESSION_HPP
#define STUBCAS_NETWORK_TCP_SESSION_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "cas/responder.hpp"
#include "network/codec.hpp"
#include "network/message_frame.hpp"

namespace stubcas {
namespace network {

// One accepted connection. Reads calls off the socket on its own thread and
// dispatches them to the responder, one call at a time.
class TCP_Session {
public:
  // Delete copy operations to prevent socket duplication
  TCP_Session(const TCP_Session&) = delete;
  TCP_Session& operator=(const TCP_Session&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TCP_Session(boost::asio::ip::tcp::socket socket, cas::Responder& responder);
  ~TCP_Session();


  // ---- STREAM CONTROL OPERATIONS ----
  // Starts the processing thread
  bool start();
  // Shuts the socket down and joins the processing thread
  void stop();


  // ---- GETTERS ----
  bool is_active() const { return processing_active_; }
  const std::string& remote() const { return remote_; }

private:
  // ---- PARAMETERS ----
  boost::asio::ip::tcp::iostream stream_;
  std::string remote_;
  cas::Responder& responder_;
  Codec codec_;

  // Processing thread
  std::unique_ptr<std::thread> processing_thread_;
  std::atomic<bool> processing_active_{false};

  // Serializes shutdown and close of the socket between stop() and the processing thread
  std::mutex socket_mutex_;
  bool socket_closed_{false};


  // ---- INCOMING CALL PROCESSING ----
  // Main loop, one iteration per call
  void process_stream();
  // Routes the opening frame of a call to its handler
  void handle_call(const MessageFrame& frame);
  void handle_read(const MessageFrame& frame);
  void handle_write(const MessageFrame& frame);
  // Collects WRITE_REQUEST frames until STREAM_END
  std::vector<cas::WriteRequest> collect_write_stream(const MessageFrame& first_frame);


  // ---- SOCKET CONTROL ----
  void shutdown_socket();
  void close_socket();


  // ---- OUTGOING DATA ----
  template <typename Message>
  void send_message(MessageType type, const Message& message);
  void send_frame(const MessageFrame& frame);
  void send_status(const cas::Status& status);
};

} // namespace network
} // namespace stubcas

#endif // STUBCAS_NETWORK_TCP_SESSION_HPP
