#include "logger/logger.hpp"
#include <iostream>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace bulk::logging {

void init_logging(std::ostream& stream, severity_level min_level) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  // Remove any existing sinks to prevent duplicates
  logging::core::get()->remove_all_sinks();

  logging::add_console_log(
    stream,
    keywords::format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "] "
        << expr::smessage
    ),
    keywords::auto_flush = true
  );

  logging::add_common_attributes();
  set_log_level(min_level);
}

void init_logging(severity_level min_level) {
  init_logging(std::clog, min_level);
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(
    boost::log::trivial::severity >= min_level
  );
}

severity_level level_from_verbosity(int verbosity) {
  if (verbosity <= 0) {
    return severity_level::warning;
  }
  if (verbosity == 1) {
    return severity_level::info;
  }
  return severity_level::debug;
}

} // namespace bulk::logging
