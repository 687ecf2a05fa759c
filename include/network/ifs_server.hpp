#ifndef IFS_NETWORK_IFS_SERVER_HPP
#define IFS_NETWORK_IFS_SERVER_HPP

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include "download/download_service.hpp"
#include "network/codec.hpp"

namespace ifs {
namespace network {

/**
 * TCP front end of the DownloadIFS call. Each accepted connection carries one
 * request and is served on its own thread; the DownloadService and its store
 * are the only state shared between connections.
 */
class IfsServer {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see get_port()
  IfsServer(const std::string& address, uint16_t port, const download::DownloadService& service);
  ~IfsServer();

  IfsServer(const IfsServer&) = delete;
  IfsServer& operator=(const IfsServer&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  // Stops accepting, closes open connections and joins their threads
  void shutdown();


  // ---- GETTERS ----
  bool is_running() const { return is_running_; }
  // Bound port, valid after start_listener()
  uint16_t get_port() const { return bound_port_; }
  std::size_t active_connections() const;

private:
  struct Connection {
    std::shared_ptr<boost::asio::ip::tcp::iostream> stream;
    std::thread thread;
    // Serializes closing the stream against shutdown() unblocking it
    std::mutex close_mutex;
    bool closed{false};
    std::atomic<bool> done{false};
  };

  // ---- PARAMETERS ----
  const std::string address_;
  const uint16_t port_;
  std::atomic<uint16_t> bound_port_{0};

  // Server state
  std::atomic<bool> is_running_{false};
  std::unique_ptr<std::thread> io_thread_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // System components
  const download::DownloadService& service_;
  Codec codec_;

  mutable std::mutex connections_mutex_;
  std::list<std::unique_ptr<Connection>> connections_;


  // ---- CONNECTION HANDLING ----
  // Main listening loop that handles incoming connections
  void start_accept();
  // Reads one request and streams the response. The caller closes the stream.
  void handle_connection(boost::asio::ip::tcp::iostream& stream);
  // Joins threads of connections that have finished
  void reap_finished_connections();
};

} // namespace network
} // namespace ifs

#endif // IFS_NETWORK_IFS_SERVER_HPP
