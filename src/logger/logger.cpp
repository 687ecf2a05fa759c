#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/stream.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>
#include <unordered_map>

namespace ifs::logging {

namespace {

namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

// Shared by the console and file sinks
boost::log::formatter make_formatter() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [Thread " << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

} // namespace

bool parse_severity(const std::string& name, boost::log::trivial::severity_level& level) {
  static const std::unordered_map<std::string, boost::log::trivial::severity_level> levels = {
    {"trace", boost::log::trivial::trace},
    {"debug", boost::log::trivial::debug},
    {"info", boost::log::trivial::info},
    {"warning", boost::log::trivial::warning},
    {"error", boost::log::trivial::error},
    {"fatal", boost::log::trivial::fatal}
  };

  auto it = levels.find(name);
  if (it == levels.end()) {
    return false;
  }
  level = it->second;
  return true;
}

void init_logging(boost::log::trivial::severity_level min_level, const std::string& log_file) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    boost::log::add_console_log(
      std::clog,
      keywords::format = make_formatter(),
      keywords::auto_flush = true
    );

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      boost::log::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::format = make_formatter(),
        keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::auto_flush = true
      );
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logger: Logging initialized"
                             << (log_file.empty() ? std::string() : " with file: " + log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(boost::log::trivial::severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace ifs::logging
