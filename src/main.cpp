#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "config/options.hpp"
#include "download/download_service.hpp"
#include "logger/logger.hpp"
#include "network/ifs_server.hpp"
#include "store/file_store.hpp"
#include "store/memory_store.hpp"

namespace {

std::unique_ptr<ifs::store::WritableContentStore> make_store(const ifs::config::ProgramOptions& options) {
  if (options.store_path.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Main: Using in-memory image store";
    return std::make_unique<ifs::store::MemoryStore>();
  }
  BOOST_LOG_TRIVIAL(info) << "Main: Using image store at " << options.store_path;
  return std::make_unique<ifs::store::FileStore>(options.store_path);
}

// Blocks until SIGINT or SIGTERM is received
void wait_for_termination() {
  boost::asio::io_context signal_context;
  boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
  signals.async_wait([](const boost::system::error_code& error, int signal_number) {
    if (!error) {
      BOOST_LOG_TRIVIAL(info) << "Main: Received signal " << signal_number << ", shutting down";
    }
  });
  signal_context.run();
}

bool run_server(const ifs::config::ProgramOptions& options) {
  try {
    auto store = make_store(options);
    ifs::download::DownloadService service(*store, ifs::download::ServiceConfig{options.chunk_size});
    ifs::network::IfsServer server(options.host, options.port, service);

    if (!server.start_listener()) {
      std::cerr << "Error: Failed to start server on " << options.host << ":" << options.port << '\n';
      return false;
    }

    if (options.daemon) {
      wait_for_termination();
    } else {
      ifs::cli::CLI cli(*store, service);
      cli.run();
    }

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Main: " << e.what();
    std::cerr << "Error: Failed to start server: " << e.what() << '\n';
    return false;
  }
}

} // namespace

int main(int argc, char* argv[]) {
  const auto options = ifs::config::parse_command_line(argc, argv, std::cerr);
  if (!options.valid) {
    return 1;
  }

  try {
    ifs::logging::init_logging(options.log_level, options.log_file);
  } catch (const std::exception&) {
    return 1;
  }

  // A client that disconnects mid-stream must surface as a failed write
  std::signal(SIGPIPE, SIG_IGN);

  return run_server(options) ? 0 : 1;
}
