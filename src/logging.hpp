#ifndef SPVD_LOGGING_HPP
#define SPVD_LOGGING_HPP
#pragma once

#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

namespace spvd {
    namespace log_level = boost::log::trivial;

    using spvd_logger_t = boost::log::sources::severity_logger_mt<log_level::severity_level>;

    BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(spvd_logger, spvd_logger_t)

#define SPVD_LOG_SEV(sev) BOOST_LOG_SEV(::spvd::spvd_logger::get(), sev)

    // Map a configured level name ("none", "error", "warn", "info", "debug")
    // onto a severity. Unknown names are a user error.
    log_level::severity_level parse_log_level(const std::string& level);

    void set_log_level(const std::string& level);

} // namespace spvd

#endif
