#pragma once
#include <boost/log/trivial.hpp>
#include <memory>
#include <string>

#include "butterfly/log/log_config.hpp"

namespace butterfly::log {

class Logger {
public:
    static void init(const LogConfig &config);
    static void shutdown();
    static LogConfig::LogLevel level_from_string(const std::string &level_str);
    static void set_level(LogConfig::LogLevel level);
    static LogConfig::LogLevel level();

private:
    static LogConfig config_;
};

}  // namespace butterfly::log

#define BUTTERFLY_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define BUTTERFLY_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define BUTTERFLY_LOG_INFO BOOST_LOG_TRIVIAL(info)
#define BUTTERFLY_LOG_WARN BOOST_LOG_TRIVIAL(warning)
#define BUTTERFLY_LOG_ERROR BOOST_LOG_TRIVIAL(error)
#define BUTTERFLY_LOG_FATAL BOOST_LOG_TRIVIAL(fatal)
