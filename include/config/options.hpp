#ifndef IFS_CONFIG_OPTIONS_HPP
#define IFS_CONFIG_OPTIONS_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <boost/log/trivial.hpp>
#include "download/chunk.hpp"

namespace ifs {
namespace config {

struct ProgramOptions {
  std::string host;
  uint16_t port{0};
  // Empty selects the in-memory store
  std::string store_path;
  uint64_t chunk_size{download::DEFAULT_CHUNK_SIZE};
  boost::log::trivial::severity_level log_level{boost::log::trivial::info};
  std::string log_file;
  // Serve without the interactive shell until SIGINT or SIGTERM
  bool daemon{false};
  bool valid{false};
};

void print_usage(const std::string& program_name, std::ostream& out);

// Parses argv. Errors are written to err together with the usage text and
// leave options.valid false.
ProgramOptions parse_command_line(int argc, const char* const argv[], std::ostream& err);

} // namespace config
} // namespace ifs

#endif // IFS_CONFIG_OPTIONS_HPP
