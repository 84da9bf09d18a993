#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace podfs::logging {

namespace logging = boost::log;
namespace keywords = boost::log::keywords;
namespace expr = boost::log::expressions;

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    std::filesystem::path log_path = std::filesystem::absolute(log_file);

    logging::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::format = (
        expr::stream
          << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
          << " [" << logging::trivial::severity << "]"
          << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
          << " " << expr::smessage
      ),
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::auto_flush = true
    );

    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void init_console_logging(severity_level min_level) {
  logging::core::get()->remove_all_sinks();
  logging::add_common_attributes();

  logging::add_console_log(
    std::clog,
    keywords::format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%H:%M:%S.%f")
        << " [" << logging::trivial::severity << "] "
        << expr::smessage
    ),
    keywords::auto_flush = true
  );

  logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

severity_level parse_severity(const std::string& name) {
  if (name == "trace") return severity_level::trace;
  if (name == "debug") return severity_level::debug;
  if (name == "info") return severity_level::info;
  if (name == "warning") return severity_level::warning;
  if (name == "error") return severity_level::error;
  if (name == "fatal") return severity_level::fatal;
  throw std::invalid_argument("Unknown log level: " + name);
}

} // namespace podfs::logging
