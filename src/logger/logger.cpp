#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace dcs::logger {

namespace {

namespace logging = boost::log;
namespace expr = boost::log::expressions;

template <typename Sink>
void install_sink(const boost::shared_ptr<Sink>& sink, severity_level min_level) {
    sink->set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "] "
            << expr::smessage
    );

    logging::core::get()->add_sink(sink);
    logging::add_common_attributes();

    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);
}

} // namespace

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, global_logger_type) {
    global_logger_type logger;
    logger.add_attribute("TimeStamp", logging::attributes::local_clock());
    logger.add_attribute("ThreadID", logging::attributes::current_thread_id());
    return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        logging::core::get()->remove_all_sinks();

        auto backend = boost::make_shared<logging::sinks::text_file_backend>();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
        backend->auto_flush(true);

        using text_sink = logging::sinks::synchronous_sink<logging::sinks::text_file_backend>;
        install_sink(boost::make_shared<text_sink>(backend), min_level);
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void init_console_logging(severity_level min_level) {
    logging::core::get()->remove_all_sinks();

    auto backend = boost::make_shared<logging::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    using text_sink = logging::sinks::synchronous_sink<logging::sinks::text_ostream_backend>;
    install_sink(boost::make_shared<text_sink>(backend), min_level);
}

void set_log_level(severity_level min_level) {
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
}

void enable_logging() {
    logging::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    logging::core::get()->set_logging_enabled(false);
}

severity_level parse_severity(const std::string& name) {
    severity_level level;
    if (!logging::trivial::from_string(name.c_str(), name.size(), level)) {
        throw std::invalid_argument("unknown log level: " + name);
    }
    return level;
}

} // namespace dcs::logger
