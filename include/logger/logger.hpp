#ifndef DCS_LOGGER_HPP
#define DCS_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <string>

namespace dcs::logger {

// Components log through BOOST_LOG_TRIVIAL, so the sinks and the global
// logger share the trivial severity scale
using severity_level = boost::log::trivial::severity_level;

using global_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

BOOST_LOG_GLOBAL_LOGGER(global_logger, global_logger_type)

// Replaces all sinks with a synchronous text file sink. The file is
// truncated on every call.
void init_logging(const std::string& log_file = "dcs.log",
                  severity_level min_level = severity_level::info);

// Replaces all sinks with a console (stderr) sink
void init_console_logging(severity_level min_level = severity_level::info);

void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// "trace" .. "fatal"; throws std::invalid_argument otherwise
severity_level parse_severity(const std::string& name);

} // namespace dcs::logger

// Convenience macros for logging
#define DCS_LOG_TRACE BOOST_LOG_SEV(dcs::logger::global_logger::get(), boost::log::trivial::trace)
#define DCS_LOG_DEBUG BOOST_LOG_SEV(dcs::logger::global_logger::get(), boost::log::trivial::debug)
#define DCS_LOG_INFO BOOST_LOG_SEV(dcs::logger::global_logger::get(), boost::log::trivial::info)
#define DCS_LOG_WARN BOOST_LOG_SEV(dcs::logger::global_logger::get(), boost::log::trivial::warning)
#define DCS_LOG_ERROR BOOST_LOG_SEV(dcs::logger::global_logger::get(), boost::log::trivial::error)
#define DCS_LOG_FATAL BOOST_LOG_SEV(dcs::logger::global_logger::get(), boost::log::trivial::fatal)

#endif // DCS_LOGGER_HPP
