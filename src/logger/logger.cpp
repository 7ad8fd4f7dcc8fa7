#include "peerdrop/logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace peerdrop::logging {

namespace {

namespace expr = boost::log::expressions;

auto log_format() {
  return expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << boost::log::trivial::severity << "] "
      << expr::smessage;
}

} // namespace

severity_level parse_severity(const std::string& name) {
  severity_level level = boost::log::trivial::info;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + name);
  }
  return level;
}

void init_logging(const LogOptions& options) {
  auto core = boost::log::core::get();

  // Clear any existing sinks
  core->remove_all_sinks();
  boost::log::add_common_attributes();

  if (options.console) {
    auto sink = boost::log::add_console_log(std::clog);
    sink->set_formatter(log_format());
  }

  if (!options.file.empty()) {
    try {
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();
      std::filesystem::path log_path = std::filesystem::absolute(options.file);
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::trunc);
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);
      sink->set_formatter(log_format());
      core->add_sink(sink);
    } catch (const std::exception& e) {
      std::cerr << "Failed to initialize file logging: " << e.what() << std::endl;
      throw;
    }
  }

  core->set_logging_enabled(options.console || !options.file.empty());
  set_log_level(options.severity);
}

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

} // namespace peerdrop::logging
