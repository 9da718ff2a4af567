#include "logging.hpp"
#include "exception.hpp"

namespace spvd {

    log_level::severity_level parse_log_level(const std::string& level)
    {
        // Default to fatal logging, effectively 'none',
        // since we don't use fatal severity for logging.
        auto severity = log_level::severity_level::fatal;
        if (level == "debug") {
            severity = log_level::severity_level::debug;
        } else if (level == "info") {
            severity = log_level::severity_level::info;
        } else if (level == "warn") {
            severity = log_level::severity_level::warning;
        } else if (level == "error") {
            severity = log_level::severity_level::error;
        } else if (level != "none") {
            throw user_error("invalid log_level: " + level);
        }
        return severity;
    }

    void set_log_level(const std::string& level)
    {
        boost::log::core::get()->set_filter(log_level::severity >= parse_log_level(level));
    }

} // namespace spvd
