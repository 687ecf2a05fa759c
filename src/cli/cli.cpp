#include "cli/cli.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <boost/log/trivial.hpp>
#include "network/ifs_client.hpp"

namespace ifs {
namespace cli {

namespace {

// Writes pushed download results into a local file
class FileResponseWriter : public download::ResponseWriter {
public:
  explicit FileResponseWriter(std::ostream& output) : output_(output) {}

  bool write(const download::DownloadResult& result) override {
    if (const auto* chunk = std::get_if<download::Chunk>(&result)) {
      output_.write(reinterpret_cast<const char*>(chunk->data.data()),
                    static_cast<std::streamsize>(chunk->data.size()));
      return static_cast<bool>(output_);
    }
    return true;
  }

private:
  std::ostream& output_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(store::WritableContentStore& store, const download::DownloadService& service,
         std::istream& input, std::ostream& output)
  : running_(false)
  , store_(store)
  , service_(service)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting command loop";
  output_ << "IFS_Shell> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "IFS_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: Command loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  for (std::string arg; iss >> arg;) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "publish") {
    handle_publish_command(args);
  }
  else if (command == "versions") {
    handle_versions_command(args);
  }
  else if (command == "download") {
    handle_download_command(args);
  }
  else if (command == "fetch") {
    handle_fetch_command(args);
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments, type help for usage" << std::endl;
  }
}

void CLI::handle_publish_command(const std::vector<std::string>& args) {
  if (args.size() != 3) {
    output_ << "Usage: publish <component> <version> <file>" << std::endl;
    return;
  }

  const auto version = parse_version(args[1]);
  if (!version) {
    output_ << "Invalid version: " << args[1] << std::endl;
    return;
  }

  std::ifstream file(args[2], std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << args[2] << std::endl;
    return;
  }

  try {
    const uint64_t bytes = store_.publish(store::ComponentId(args[0]), *version, file);
    output_ << "Published " << args[0] << "@" << *version << " (" << bytes << " bytes)" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error publishing image", e.what());
  }
}

void CLI::handle_versions_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: versions <component>" << std::endl;
    return;
  }

  try {
    const auto versions = store_.list_versions(store::ComponentId(args[0]));
    if (versions.empty()) {
      output_ << "No versions published for " << args[0] << std::endl;
      return;
    }
    for (const auto version : versions) {
      output_ << version << std::endl;
    }
  } catch (const std::exception& e) {
    log_and_display_error("Error listing versions", e.what());
  }
}

void CLI::handle_download_command(const std::vector<std::string>& args) {
  download::DownloadRequest request;
  std::string outfile;
  if (!parse_download_target(args, 0, request, outfile)) {
    output_ << "Usage: download <component> [version] <outfile>" << std::endl;
    return;
  }

  std::ofstream file(outfile, std::ios::binary | std::ios::trunc);
  if (!file) {
    output_ << "Error opening file: " << outfile << std::endl;
    return;
  }

  FileResponseWriter writer(file);
  const auto outcome = service_.download(request, writer);
  if (outcome.state == download::DownloadState::State::COMPLETED) {
    output_ << "Downloaded " << request.component_id << "@" << *outcome.version << " to " << outfile
            << " (" << outcome.bytes << " bytes)" << std::endl;
  } else if (outcome.error) {
    output_ << "Download failed: " << error_kind_to_string(outcome.error->kind) << ": "
            << outcome.error->message << std::endl;
  } else {
    output_ << "Download ended in state " << download::DownloadState::state_to_string(outcome.state) << std::endl;
  }
}

void CLI::handle_fetch_command(const std::vector<std::string>& args) {
  download::DownloadRequest request;
  std::string outfile;
  if (args.empty() || !parse_download_target(args, 1, request, outfile)) {
    output_ << "Usage: fetch <ip:port> <component> [version] <outfile>" << std::endl;
    return;
  }

  const std::string& connection_string = args[0];
  const std::size_t colon_pos = connection_string.rfind(':');
  if (colon_pos == std::string::npos) {
    output_ << "Invalid format. Usage: fetch ip:port ... (e.g., fetch 127.0.0.1:3002 ...)" << std::endl;
    return;
  }

  const std::string ip = connection_string.substr(0, colon_pos);
  const std::string port_str = connection_string.substr(colon_pos + 1);
  uint16_t port = 0;
  try {
    const unsigned long value = std::stoul(port_str);
    if (value == 0 || value > 65535) {
      throw std::out_of_range("port");
    }
    port = static_cast<uint16_t>(value);
  } catch (const std::exception&) {
    output_ << "Invalid port number: " << port_str << std::endl;
    return;
  }

  std::ofstream file(outfile, std::ios::binary | std::ios::trunc);
  if (!file) {
    output_ << "Error opening file: " << outfile << std::endl;
    return;
  }

  network::IfsClient client(ip, port);
  const auto result = client.download_to(request, file);
  if (result.ok()) {
    output_ << "Fetched " << request.component_id << " from " << ip << ":" << port << " to " << outfile
            << " (" << result.bytes << " bytes)" << std::endl;
  } else if (result.error) {
    output_ << "Fetch failed: " << error_kind_to_string(result.error->kind) << ": "
            << result.error->message << std::endl;
  } else {
    output_ << "Fetch ended in state " << network::fetch_status_to_string(result.status) << std::endl;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                                          Display this help message" << std::endl;
  output_ << "  publish <component> <version> <file>          Publish local <file> as an image" << std::endl;
  output_ << "  versions <component>                          List published versions" << std::endl;
  output_ << "  download <component> [version] <out>          Download an image from the local store" << std::endl;
  output_ << "  fetch <ip:port> <component> [version] <out>   Download an image from a remote server" << std::endl;
  output_ << "  quit                                          Exit the IFS shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}


//==============================================
// UTILITY METHODS
//==============================================

bool CLI::parse_download_target(const std::vector<std::string>& args, std::size_t first,
                                download::DownloadRequest& request, std::string& outfile) {
  const std::size_t count = args.size() - std::min(first, args.size());
  if (count == 2) {
    request.component_id = store::ComponentId(args[first]);
    outfile = args[first + 1];
    return true;
  }
  if (count == 3) {
    const auto version = parse_version(args[first + 1]);
    if (!version) {
      return false;
    }
    request.component_id = store::ComponentId(args[first]);
    request.version = version;
    outfile = args[first + 2];
    return true;
  }
  return false;
}

std::optional<store::Version> CLI::parse_version(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<store::Version>(std::stoull(text));
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

} // namespace cli
} // namespace ifs
