#include "butterfly/log/logger.hpp"

#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <filesystem>
#include <iostream>

namespace logging = boost::log;
namespace sinks = boost::log::sinks;

namespace butterfly::log {

LogConfig Logger::config_;

namespace {

logging::trivial::severity_level to_boost_level(LogConfig::LogLevel level) {
    switch (level) {
        case LogConfig::LogLevel::TRACE:
            return logging::trivial::trace;
        case LogConfig::LogLevel::DEBUG:
            return logging::trivial::debug;
        case LogConfig::LogLevel::INFO:
            return logging::trivial::info;
        case LogConfig::LogLevel::WARN:
            return logging::trivial::warning;
        case LogConfig::LogLevel::ERROR:
            return logging::trivial::error;
        case LogConfig::LogLevel::FATAL:
            return logging::trivial::fatal;
        default:
            return logging::trivial::info;
    }
}

}  // namespace

void Logger::init(const LogConfig& config) {
    config.validate();
    config_ = config;

    logging::register_simple_formatter_factory<
        logging::trivial::severity_level, char>("Severity");

    if (config.file.enabled) {
        std::filesystem::path log_path(config.file.log_file);
        auto parent_path = log_path.parent_path();
        if (!parent_path.empty()) {
            std::filesystem::create_directories(parent_path);
        }

        logging::add_file_log(
            logging::keywords::file_name = config.file.log_file,
            logging::keywords::rotation_size = config.file.max_file_size,
            logging::keywords::time_based_rotation =
                sinks::file::rotation_at_time_point(0, 0, 0),
            logging::keywords::max_files = config.file.max_files,
            logging::keywords::auto_flush = true,
            logging::keywords::format =
                logging::parse_formatter(config.file.pattern));
    }

    if (config.console.enabled) {
        logging::add_console_log(
            std::clog, logging::keywords::format =
                           logging::parse_formatter(config.console.pattern));
    }

    logging::add_common_attributes();

    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>(
            "Severity") >= to_boost_level(config.global_level));

    BUTTERFLY_LOG_INFO << "Logger initialized, level "
                       << LogConfig::level_to_string(config.global_level);
}

void Logger::shutdown() {
    BUTTERFLY_LOG_INFO << "Logger shutting down";
    logging::core::get()->flush();
    logging::core::get()->remove_all_sinks();
}

LogConfig::LogLevel Logger::level_from_string(const std::string& level_str) {
    return LogConfig::level_from_string(level_str);
}

void Logger::set_level(LogConfig::LogLevel level) {
    config_.global_level = level;
    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>(
            "Severity") >= to_boost_level(level));
    BUTTERFLY_LOG_DEBUG << "Log level set to: "
                        << LogConfig::level_to_string(level);
}

LogConfig::LogLevel Logger::level() { return config_.global_level; }

}  // namespace butterfly::log
