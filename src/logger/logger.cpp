#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace vstore::logger {

namespace {

namespace logging = boost::log;
namespace expr = boost::log::expressions;

// Timestamp, thread and severity in front of every record
template <typename Sink>
void set_record_format(Sink& sink) {
    sink->set_formatter(
        expr::stream
            << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
            << " [" << logging::trivial::severity << "]"
            << " [" << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
            << expr::smessage
    );
}

void apply_filter(severity_level min_level) {
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);
}

} // namespace

severity_level parse_severity(const std::string& name) {
    if (name == "trace") return severity_level::trace;
    if (name == "debug") return severity_level::debug;
    if (name == "info") return severity_level::info;
    if (name == "warning") return severity_level::warning;
    if (name == "error") return severity_level::error;
    if (name == "fatal") return severity_level::fatal;
    throw std::invalid_argument("Logger: Unknown severity level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        logging::core::get()->remove_all_sinks();

        auto backend = boost::make_shared<logging::sinks::text_file_backend>();
        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::app);
        backend->auto_flush(true);

        using text_sink = logging::sinks::synchronous_sink<logging::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);
        set_record_format(sink);

        logging::core::get()->add_sink(sink);
        logging::add_common_attributes();
        apply_filter(min_level);

        BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
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
    auto sink = boost::make_shared<text_sink>(backend);
    set_record_format(sink);

    logging::core::get()->add_sink(sink);
    logging::add_common_attributes();
    apply_filter(min_level);
}

} // namespace vstore::logger
