#include "network/ifs_server.hpp"
#include <boost/log/trivial.hpp>

namespace ifs {
namespace network {

namespace {

// Writes download results to the connection as response frames
class StreamResponseWriter : public download::ResponseWriter {
public:
  StreamResponseWriter(const Codec& codec, std::iostream& stream)
    : codec_(codec)
    , stream_(stream) {}

  bool write(const download::DownloadResult& result) override {
    try {
      codec_.serialize_response(ResponseFrame::from_result(result), stream_);
      return stream_.good();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "IFS server: Failed to write response frame: " << e.what();
      return false;
    }
  }

private:
  const Codec& codec_;
  std::iostream& stream_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IfsServer::IfsServer(const std::string& address, uint16_t port, const download::DownloadService& service)
  : address_(address)
  , port_(port)
  , service_(service) {
  BOOST_LOG_TRIVIAL(info) << "IFS server: Initializing IFS server on " << address << ":" << port;
}

IfsServer::~IfsServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool IfsServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "IFS server: Server already running";
    return false;
  }

  try {
    boost::asio::ip::tcp::endpoint endpoint(
      boost::asio::ip::make_address(address_),
      port_
    );

    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    // A stopped io_context must be restarted before it can run again
    io_context_.restart();
    start_accept();

    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "IFS server: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "IFS server: Server started successfully on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "IFS server: Failed to start server: " << e.what();
    acceptor_.reset();
    return false;
  }
}

void IfsServer::shutdown() {
  if (!is_running_.exchange(false)) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "IFS server: Initiating server shutdown";

  // Stop io_context and wait for io_thread to finish
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "IFS server: Error closing acceptor: " << ec.message();
    }
  }
  acceptor_.reset();

  // Unblock connection threads still reading or writing, then wait for them
  std::lock_guard<std::mutex> lock(connections_mutex_);
  for (auto& connection : connections_) {
    std::lock_guard<std::mutex> close_lock(connection->close_mutex);
    if (!connection->closed) {
      boost::system::error_code ec;
      connection->stream->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
  }
  for (auto& connection : connections_) {
    if (connection->thread.joinable()) {
      connection->thread.join();
    }
  }
  connections_.clear();

  BOOST_LOG_TRIVIAL(info) << "IFS server: Server shutdown complete";
}

std::size_t IfsServer::active_connections() const {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  std::size_t active = 0;
  for (const auto& connection : connections_) {
    if (!connection->done) {
      ++active;
    }
  }
  return active;
}


//==============================================
// CONNECTION HANDLING
//==============================================

void IfsServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  auto stream = std::make_shared<boost::asio::ip::tcp::iostream>();

  acceptor_->async_accept(stream->socket(),
    [this, stream](const boost::system::error_code& error) {
      if (error == boost::asio::error::operation_aborted) {
        return;  // Acceptor closed by shutdown
      }
      if (error) {
        BOOST_LOG_TRIVIAL(error) << "IFS server: Accept error: " << error.message();
        start_accept();
        return;
      }

      reap_finished_connections();

      auto connection = std::make_unique<Connection>();
      connection->stream = stream;
      Connection* raw = connection.get();
      {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.push_back(std::move(connection));
        raw->thread = std::thread([this, raw]() {
          handle_connection(*raw->stream);
          {
            std::lock_guard<std::mutex> close_lock(raw->close_mutex);
            raw->stream->close();
            raw->closed = true;
          }
          raw->done = true;
        });
      }

      start_accept();  // Continue accepting new connections
    });
}

void IfsServer::handle_connection(boost::asio::ip::tcp::iostream& stream) {
  boost::system::error_code ec;
  const auto remote = stream.socket().remote_endpoint(ec);
  BOOST_LOG_TRIVIAL(info) << "IFS server: Accepted connection from "
                          << (ec ? std::string("unknown peer") : remote.address().to_string());

  try {
    const download::DownloadRequest request = codec_.deserialize_request(stream);

    StreamResponseWriter writer(codec_, stream);
    const download::DownloadOutcome outcome = service_.download(request, writer);

    // A natural end is closed with an explicit marker so clients can tell it from a dropped connection
    if (outcome.state == download::DownloadState::State::COMPLETED) {
      codec_.serialize_response(ResponseFrame::end_of_stream(), stream);
    }

    BOOST_LOG_TRIVIAL(info) << "IFS server: Request for " << request.component_id << " finished in state "
                            << download::DownloadState::state_to_string(outcome.state) << " after "
                            << outcome.chunks << " chunks, " << outcome.bytes << " bytes";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "IFS server: Error handling connection: " << e.what();
  }
}

void IfsServer::reap_finished_connections() {
  std::lock_guard<std::mutex> lock(connections_mutex_);
  for (auto it = connections_.begin(); it != connections_.end();) {
    if ((*it)->done) {
      if ((*it)->thread.joinable()) {
        (*it)->thread.join();
      }
      it = connections_.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace network
} // namespace ifs
