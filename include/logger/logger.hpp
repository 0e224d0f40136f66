#ifndef BULK_LOGGER_HPP
#define BULK_LOGGER_HPP

#include <ostream>
#include <boost/log/trivial.hpp>

namespace bulk::logging {

using severity_level = boost::log::trivial::severity_level;

// Replace all sinks with a single console sink on the given stream:
//   2024-01-01 12:00:00.000000 [info] BlobStore: ...
// The stream must outlive the sink (until remove_all_sinks or re-init).
void init_logging(std::ostream& stream, severity_level min_level = severity_level::warning);
// Same, writing to std::clog
void init_logging(severity_level min_level = severity_level::warning);

// Adjust the severity filter of the installed sinks
void set_log_level(severity_level min_level);

// 0 -> warning, 1 -> info, 2 or more -> debug
severity_level level_from_verbosity(int verbosity);

} // namespace bulk::logging

#endif // BULK_LOGGER_HPP
