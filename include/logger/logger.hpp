#ifndef FATSPLIT_LOGGER_HPP
#define FATSPLIT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <optional>
#include <string>

namespace fatsplit::logging {

using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, ::fatsplit::logging::logger_type)

// Initialize logging system: file sink (truncated on start) plus optional console sink
void init_logging(const std::string& log_file = "fatsplit.log",
                  severity_level min_level = severity_level::info,
                  bool console = false);

// Change the minimum severity without touching the sinks
void set_log_level(severity_level min_level);

// Maps "trace", "debug", "info", "warning", "error", "fatal" to a level
std::optional<severity_level> parse_severity(const std::string& name);

} // namespace fatsplit::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(fatsplit::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(fatsplit::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(fatsplit::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(fatsplit::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(fatsplit::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(fatsplit::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // FATSPLIT_LOGGER_HPP
