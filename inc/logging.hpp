#pragma once

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

//#define PDFTOC_LOG_ENABLE_FILE_SINK

//#define PDFTOC_LOG_ENABLE_FILE_LINE_FUNCTION

#ifndef PDFTOC_LOG_FILENAME_PATTERN
#define PDFTOC_LOG_FILENAME_PATTERN "pdftoc_%Y%m%d_%H:%M:%S.%06N.log"
#endif

#ifndef PDFTOC_LOG_ROTATION_SIZE
#define PDFTOC_LOG_ROTATION_SIZE 10*1024*1024
#endif

#ifndef PDFTOC_LOG_SEVERITY_THRESHOLD
#define PDFTOC_LOG_SEVERITY_THRESHOLD warning
#endif

BOOST_LOG_GLOBAL_LOGGER(logger, boost::log::sources::severity_channel_logger_mt<boost::log::trivial::severity_level>)

// Installs the std::clog sink (and the file sink when compiled in).
// Records below the threshold are discarded. Safe to call more than once,
// later calls replace the sinks of earlier ones.
void init_logging(boost::log::trivial::severity_level threshold = boost::log::trivial::PDFTOC_LOG_SEVERITY_THRESHOLD);

#ifdef PDFTOC_LOG_ENABLE_FILE_LINE_FUNCTION
#define LOG(logger, severity) BOOST_LOG_SEV(logger::get(), boost::log::trivial::severity) \
    << "(" << __FILE__ << ":" << __LINE__ << ":" << __FUNCTION__ << ") "
#define LOG_CHANNEL(logger, channel, severity) BOOST_LOG_CHANNEL_SEV(logger::get(), channel, boost::log::trivial::severity) \
    << "(" << __FILE__ << ":" << __LINE__ << ":" << __FUNCTION__ << ") "
#else
#define LOG(logger, severity) BOOST_LOG_SEV(logger::get(), boost::log::trivial::severity)
#define LOG_CHANNEL(logger, channel, severity) BOOST_LOG_CHANNEL_SEV(logger::get(), channel, boost::log::trivial::severity)
#endif

// ===== log macros =====
#define LOG_DEBUG   LOG(logger, debug)
#define LOG_INFO    LOG(logger, info)

#define LOG_CHANNEL_TRACE(channel)   LOG_CHANNEL(logger, channel, trace)
#define LOG_CHANNEL_DEBUG(channel)   LOG_CHANNEL(logger, channel, debug)
#define LOG_CHANNEL_INFO(channel)    LOG_CHANNEL(logger, channel, info)
#define LOG_CHANNEL_WARNING(channel) LOG_CHANNEL(logger, channel, warning)
#define LOG_CHANNEL_ERROR(channel)   LOG_CHANNEL(logger, channel, error)
