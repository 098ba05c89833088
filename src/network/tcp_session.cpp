#include "network/tcp_session.hpp"
#include <boost/log/trivial.hpp>
#include "network/wire_format.hpp"

namespace stubcas {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

namespace {

std::string describe_remote(const boost::asio::basic_socket<boost::asio::ip::tcp>& socket) {
  boost::system::error_code ec;
  auto endpoint = socket.remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // namespace

TCP_Session::TCP_Session(boost::asio::ip::tcp::socket socket, cas::Responder& responder)
  : stream_(std::move(socket))
  , remote_(describe_remote(stream_.socket()))
  , responder_(responder) {
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Created session for " << remote_;
}

TCP_Session::~TCP_Session() {
  stop();
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Session destroyed: " << remote_;
}


//==============================================
// STREAM CONTROL OPERATIONS
//==============================================

bool TCP_Session::start() {
  if (processing_active_) {
    BOOST_LOG_TRIVIAL(debug) << "TCP session: Processing already active for " << remote_;
    return false;
  }

  if (!stream_.socket().is_open()) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: Cannot start processing - socket not connected";
    return false;
  }

  processing_active_ = true;
  processing_thread_ = std::make_unique<std::thread>(&TCP_Session::process_stream, this);
  BOOST_LOG_TRIVIAL(info) << "TCP session: Processing started for " << remote_;
  return true;
}

void TCP_Session::stop() {
  // Wakes a blocked read so the processing thread can observe the closed stream
  shutdown_socket();

  if (processing_thread_ && processing_thread_->joinable()) {
    processing_thread_->join();
    processing_thread_.reset();
    BOOST_LOG_TRIVIAL(debug) << "TCP session: Processing thread joined for " << remote_;
  }
}


//==============================================
// INCOMING CALL PROCESSING
//==============================================

void TCP_Session::process_stream() {
  try {
    while (true) {
      std::optional<MessageFrame> frame = codec_.deserialize(stream_);
      if (!frame) {
        BOOST_LOG_TRIVIAL(info) << "TCP session: Peer " << remote_ << " closed the connection";
        break;
      }
      handle_call(*frame);
    }
  }
  catch (const std::exception& e) {
    // Stream shut down by stop() also lands here
    BOOST_LOG_TRIVIAL(warning) << "TCP session: Closing connection to " << remote_ << ": " << e.what();
  }

  close_socket();
  processing_active_ = false;
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Stream processing stopped for " << remote_;
}

void TCP_Session::handle_call(const MessageFrame& frame) {
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Call " << message_type_to_string(frame.message_type)
                           << " from " << remote_;
  try {
    switch (frame.message_type) {
      case MessageType::READ_REQUEST:
        handle_read(frame);
        return;
      case MessageType::WRITE_REQUEST:
      case MessageType::STREAM_END:
        handle_write(frame);
        return;
      case MessageType::QUERY_WRITE_STATUS_REQUEST:
        send_message(MessageType::QUERY_WRITE_STATUS_RESPONSE, responder_.query_write_status(
          decode_payload<cas::QueryWriteStatusRequest>(frame.payload)));
        break;
      case MessageType::FIND_MISSING_BLOBS_REQUEST:
        send_message(MessageType::FIND_MISSING_BLOBS_RESPONSE, responder_.find_missing_blobs(
          decode_payload<cas::FindMissingBlobsRequest>(frame.payload)));
        break;
      case MessageType::BATCH_UPDATE_BLOBS_REQUEST:
        send_message(MessageType::BATCH_UPDATE_BLOBS_RESPONSE, responder_.batch_update_blobs(
          decode_payload<cas::BatchUpdateBlobsRequest>(frame.payload)));
        break;
      case MessageType::GET_TREE_REQUEST:
        send_message(MessageType::GET_TREE_RESPONSE, responder_.get_tree(
          decode_payload<cas::GetTreeRequest>(frame.payload)));
        break;
      default:
        BOOST_LOG_TRIVIAL(warning) << "TCP session: Unknown method frame type "
                                   << static_cast<int>(frame.message_type);
        send_status({cas::StatusCode::UNIMPLEMENTED,
          "Unknown method: frame type " + std::to_string(static_cast<int>(frame.message_type))});
        return;
    }
    send_status({cas::StatusCode::OK, ""});
  }
  catch (const cas::RpcError& e) {
    send_status(e.status());
  }
  catch (const CodecError&) {
    throw;
  }
  catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: Call " << message_type_to_string(frame.message_type)
                             << " aborted: " << e.what();
    send_status({cas::StatusCode::UNKNOWN, e.what()});
  }
}

void TCP_Session::handle_read(const MessageFrame& frame) {
  auto request = decode_payload<cas::ReadRequest>(frame.payload);

  // All chunks exist before the first is sent, a failure sends only the status
  std::vector<cas::ReadResponse> chunks = responder_.read(request);
  for (const auto& chunk : chunks) {
    send_message(MessageType::READ_RESPONSE, chunk);
  }
  send_status({cas::StatusCode::OK, ""});
}

void TCP_Session::handle_write(const MessageFrame& frame) {
  std::vector<cas::WriteRequest> requests = collect_write_stream(frame);
  cas::WriteResponse response = responder_.write(requests);
  send_message(MessageType::WRITE_RESPONSE, response);
  send_status({cas::StatusCode::OK, ""});
}

std::vector<cas::WriteRequest> TCP_Session::collect_write_stream(const MessageFrame& first_frame) {
  std::vector<cas::WriteRequest> requests;
  MessageFrame frame = first_frame;

  while (frame.message_type == MessageType::WRITE_REQUEST) {
    requests.push_back(decode_payload<cas::WriteRequest>(frame.payload));

    std::optional<MessageFrame> next = codec_.deserialize(stream_);
    if (!next) {
      throw CodecError("TCP session: Connection closed in the middle of a write stream");
    }
    frame = std::move(*next);
  }

  if (frame.message_type != MessageType::STREAM_END) {
    BOOST_LOG_TRIVIAL(error) << "TCP session: Unexpected " << message_type_to_string(frame.message_type)
                             << " frame inside a write stream";
    throw CodecError("TCP session: Unexpected frame inside a write stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP session: Write stream of " << requests.size() << " messages from " << remote_;
  return requests;
}


//==============================================
// SOCKET CONTROL
//==============================================

void TCP_Session::shutdown_socket() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_closed_) {
    return;
  }
  boost::system::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "TCP session: Error shutting down socket: " << ec.message();
  }
}

void TCP_Session::close_socket() {
  std::lock_guard<std::mutex> lock(socket_mutex_);
  if (socket_closed_) {
    return;
  }
  boost::system::error_code ec;
  stream_.socket().close(ec);
  socket_closed_ = true;
}


//==============================================
// OUTGOING DATA
//==============================================

template <typename Message>
void TCP_Session::send_message(MessageType type, const Message& message) {
  send_frame(make_frame(type, encode_payload(message)));
}

void TCP_Session::send_frame(const MessageFrame& frame) {
  codec_.serialize(frame, stream_);
}

void TCP_Session::send_status(const cas::Status& status) {
  BOOST_LOG_TRIVIAL(debug) << "TCP session: Sending status " << status.code << " to " << remote_;
  send_message(MessageType::STATUS, status);
}

} // namespace network
} // namespace stubcas
