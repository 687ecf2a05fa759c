#include "config/options.hpp"
#include <unordered_set>
#include "logger/logger.hpp"

namespace ifs {
namespace config {

void print_usage(const std::string& program_name, std::ostream& out) {
  out << "Usage: " << program_name << " -h <host> -p <port> [options]\n"
      << "Required arguments:\n"
      << "  -h, --host        Host address\n"
      << "  -p, --port        Port number\n"
      << "Optional arguments:\n"
      << "  -s, --store       Image store directory (in-memory store if omitted)\n"
      << "  -c, --chunk-size  Chunk size in bytes (default " << download::DEFAULT_CHUNK_SIZE << ")\n"
      << "  -l, --log-level   trace, debug, info, warning, error or fatal (default info)\n"
      << "  -f, --log-file    Also write logs to this file\n"
      << "      --daemon      Run without the interactive shell\n"
      << "Example: " << program_name << " -h 127.0.0.1 -p 3001 -s ./ifs_store\n";
}

ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err) {
  static const std::unordered_set<std::string> value_flags = {
    "-h", "--host",
    "-p", "--port",
    "-s", "--store",
    "-c", "--chunk-size",
    "-l", "--log-level",
    "-f", "--log-file"
  };

  const std::string program_name = argc > 0 ? argv[0] : "ifs_server";
  ProgramOptions options;

  auto reject = [&](const std::string& message) {
    err << "Error: " << message << '\n';
    print_usage(program_name, err);
    options.valid = false;
    return options;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--daemon") {
      options.daemon = true;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      return reject("Unknown argument: " + flag);
    }
    if (i + 1 >= argc) {
      return reject("Missing value for " + flag);
    }
    const std::string value(argv[++i]);

    if (flag == "-h" || flag == "--host") {
      options.host = value;
    } else if (flag == "-p" || flag == "--port") {
      try {
        std::size_t consumed = 0;
        const unsigned long port = std::stoul(value, &consumed);
        if (consumed != value.size() || port == 0 || port > 65535) {
          return reject("Invalid port number: " + value);
        }
        options.port = static_cast<uint16_t>(port);
      } catch (const std::exception&) {
        return reject("Invalid port number: " + value);
      }
    } else if (flag == "-s" || flag == "--store") {
      options.store_path = value;
    } else if (flag == "-c" || flag == "--chunk-size") {
      try {
        std::size_t consumed = 0;
        const unsigned long long size = std::stoull(value, &consumed);
        if (consumed != value.size() || size == 0 || size > download::MAX_CHUNK_SIZE) {
          return reject("Chunk size must be between 1 and " + std::to_string(download::MAX_CHUNK_SIZE));
        }
        options.chunk_size = size;
      } catch (const std::exception&) {
        return reject("Invalid chunk size: " + value);
      }
    } else if (flag == "-l" || flag == "--log-level") {
      if (!logging::parse_severity(value, options.log_level)) {
        return reject("Unknown log level: " + value);
      }
    } else if (flag == "-f" || flag == "--log-file") {
      options.log_file = value;
    }
  }

  if (options.host.empty() || options.port == 0) {
    return reject("Both host and port are required");
  }

  options.valid = true;
  return options;
}

} // namespace config
} // namespace ifs
