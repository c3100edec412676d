#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/named_scope.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <unordered_map>

namespace fatsplit::logging {

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, ::fatsplit::logging::logger_type) {
  logger_type logger;

  // Add common attributes
  logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
  logger.add_attribute("Scope", boost::log::attributes::named_scope());

  return logger;
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace expr = boost::log::expressions;
  namespace sinks = boost::log::sinks;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << expr::attr<severity_level>("Severity") << "] "
        << expr::smessage;

    // File sink, fresh log per run
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    auto backend = boost::make_shared<sinks::text_file_backend>();
    backend->set_file_name_pattern(log_path.string());
    backend->set_open_mode(std::ios::out | std::ios::trunc);
    backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto sink = boost::make_shared<file_sink>(backend);
    sink->set_formatter(formatter);
    boost::log::core::get()->add_sink(sink);

    if (console) {
      auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
      console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
      console_backend->auto_flush(true);

      using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
      auto csink = boost::make_shared<console_sink>(console_backend);
      csink->set_formatter(formatter);
      boost::log::core::get()->add_sink(csink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(debug) << "Logging system initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

std::optional<severity_level> parse_severity(const std::string& name) {
  static const std::unordered_map<std::string, severity_level> levels = {
    {"trace", severity_level::trace},
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warning", severity_level::warning},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal}
  };

  auto it = levels.find(name);
  if (it == levels.end()) {
    return std::nullopt;
  }
  return it->second;
}

} // namespace fatsplit::logging
