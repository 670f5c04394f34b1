#ifndef BLOBSTORE_LOGGER_HPP
#define BLOBSTORE_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

// Replaces every sink with a text file sink at log_file. The file is
// truncated and flushed after each record. Throws on an unusable path.
void init_logging(const std::string& log_file = "blobstore.log",
                  severity_level min_level = boost::log::trivial::info);

// Drops records below level
void set_log_level(severity_level level);

void enable_logging();
void disable_logging();

// Parses trace, debug, info, warning, error or fatal.
// Throws std::invalid_argument on anything else.
severity_level parse_log_level(const std::string& text);

} // namespace logging
} // namespace blobstore

#endif // BLOBSTORE_LOGGER_HPP
