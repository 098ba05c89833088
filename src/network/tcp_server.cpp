#include "network/tcp_server.hpp"

namespace stubcas {
namespace network {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TCP_Server::TCP_Server(const uint16_t port, const std::string& address, cas::Responder& responder)
  : port_(port)
  , address_(address)
  , responder_(responder) {
  BOOST_LOG_TRIVIAL(debug) << "TCP server: Configured for " << address_ << ":" << port_;
}

TCP_Server::~TCP_Server() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TCP_Server::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP server: Listener already running on port " << bound_port_;
    return false;
  }

  try {
    open_acceptor();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Cannot listen on " << address_ << ":" << port_ << ": " << e.what();
    acceptor_.reset();
    return false;
  }

  is_running_ = true;
  start_accept();
  run_io_context();

  BOOST_LOG_TRIVIAL(info) << "TCP server: Listening on " << address_ << ":" << bound_port_;
  return true;
}

void TCP_Server::open_acceptor() {
  boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);

  // A previous shutdown leaves the io_context stopped
  io_context_.restart();

  acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
  bound_port_ = acceptor_->local_endpoint().port();
}

void TCP_Server::run_io_context() {
  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      auto work_guard = boost::asio::make_work_guard(io_context_);
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "TCP server: Accept loop terminated: " << e.what();
      is_running_ = false;
    }
  });
}

void TCP_Server::shutdown() {
  if (!is_running_ && !io_thread_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP server: Stopping listener on " << address_ << ":" << bound_port_;
  is_running_ = false;

  close_acceptor();

  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();
  acceptor_.reset();

  stop_sessions();
  BOOST_LOG_TRIVIAL(info) << "TCP server: Listener stopped";
}

void TCP_Server::close_acceptor() {
  if (!acceptor_ || !acceptor_->is_open()) {
    return;
  }
  boost::system::error_code ec;
  acceptor_->close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Error closing acceptor: " << ec.message();
  }
}

void TCP_Server::stop_sessions() {
  std::vector<std::shared_ptr<TCP_Session>> sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  // Each stop() joins a processing thread, done outside the lock
  for (auto& session : sessions) {
    session->stop();
  }
  BOOST_LOG_TRIVIAL(debug) << "TCP server: Closed " << sessions.size() << " connections";
}


//==============================================
// CONNECTION HANDLING
//==============================================

void TCP_Server::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  acceptor_->async_accept(
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (error == boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(debug) << "TCP server: Accept cancelled";
        return;
      }
      if (error) {
        BOOST_LOG_TRIVIAL(error) << "TCP server: Accept error: " << error.message();
      } else {
        create_session(std::move(socket));
      }
      start_accept();
    });
}

void TCP_Server::create_session(boost::asio::ip::tcp::socket socket) {
  prune_sessions();

  auto session = std::make_shared<TCP_Session>(std::move(socket), responder_);
  if (!session->start()) {
    BOOST_LOG_TRIVIAL(error) << "TCP server: Dropping connection from " << session->remote();
    return;
  }

  std::lock_guard<std::mutex> lock(sessions_mutex_);
  sessions_.push_back(session);
  BOOST_LOG_TRIVIAL(info) << "TCP server: Accepted connection from " << session->remote()
                          << ", " << sessions_.size() << " open";
}

void TCP_Server::prune_sessions() {
  std::vector<std::shared_ptr<TCP_Session>> finished;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto done = std::partition(sessions_.begin(), sessions_.end(),
                               [](const std::shared_ptr<TCP_Session>& s) { return s->is_active(); });
    finished.assign(done, sessions_.end());
    sessions_.erase(done, sessions_.end());
  }
  for (auto& session : finished) {
    session->stop();
  }
}

std::size_t TCP_Server::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return static_cast<std::size_t>(std::count_if(sessions_.begin(), sessions_.end(),
    [](const std::shared_ptr<TCP_Session>& s) { return s->is_active(); }));
}

} // namespace network
} // namespace stubcas
