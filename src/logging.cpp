#include "logging.hpp"

#include <boost/log/core/core.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/counter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <iomanip>
#include <iostream>
#include <ostream>

BOOST_LOG_ATTRIBUTE_KEYWORD(line_id, "LineID", unsigned int)
BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", boost::log::trivial::severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(channel, "Channel", std::string)

BOOST_LOG_GLOBAL_LOGGER_INIT(logger, boost::log::sources::severity_channel_logger_mt) {
    boost::log::sources::severity_channel_logger_mt<boost::log::trivial::severity_level> logger;

    // add attributes
    logger.add_attribute("LineID", boost::log::attributes::counter<unsigned int>(1));     // lines are sequentially numbered
    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());             // each log line gets a timestamp

    return logger;
}

void init_logging(boost::log::trivial::severity_level threshold) {
    // the console only shows what a user running --debug wants to read
    boost::log::formatter console_formatter = boost::log::expressions::stream
                                              << "[" << std::setw(7) << std::left << boost::log::trivial::severity << "] "
                                              << boost::log::expressions::if_(channel != "") [
                                                  boost::log::expressions::stream << "[" << std::setw(9) << channel << "] "
                                              ]
                                              << boost::log::expressions::smessage;

    boost::shared_ptr<boost::log::core> core = boost::log::core::get();
    core->remove_all_sinks();

    boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>> console_sink = boost::make_shared<boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>>();
    console_sink->locked_backend()->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    console_sink->locked_backend()->auto_flush(true);
    console_sink->set_formatter(console_formatter);
    console_sink->set_filter(severity >= threshold);
    core->add_sink(console_sink);

#ifdef PDFTOC_LOG_ENABLE_FILE_SINK
    boost::log::formatter file_formatter = boost::log::expressions::stream
                                           << std::setw(7) << std::right << std::setfill('0') << line_id << std::setfill(' ') << " | "
                                           << boost::log::expressions::format_date_time(timestamp, "%Y-%m-%d %H:%M:%S.%f") << " ["
                                           << std::setw(7) << std::left << boost::log::trivial::severity << "] "
                                           << boost::log::expressions::if_(channel != "") [
                                               boost::log::expressions::stream << "[" << std::setw(9) << channel << "] "
                                           ]
                                           << "- " << boost::log::expressions::smessage;

    boost::shared_ptr<boost::log::sinks::text_file_backend> backend =
        boost::make_shared<boost::log::sinks::text_file_backend>(
            boost::log::keywords::file_name = PDFTOC_LOG_FILENAME_PATTERN,
            boost::log::keywords::rotation_size = PDFTOC_LOG_ROTATION_SIZE);
    boost::shared_ptr<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>> file_sink = boost::make_shared<boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>>(backend);
    file_sink->set_formatter(file_formatter);
    file_sink->set_filter(severity >= boost::log::trivial::trace);
    core->add_sink(file_sink);
#endif
}
