#pragma once

#include <cstdint>
#include <string>

#include "butterfly/config/config.hpp"

namespace butterfly::log {

// Settings of the "log" section
class LogConfig
    : public config::ReloadableConfigurationProperties<LogConfig> {
public:
    enum class LogLevel {
        TRACE = 0,
        DEBUG = 1,
        INFO = 2,
        WARN = 3,
        ERROR = 4,
        FATAL = 5
    };

    struct ConsoleConfig {
        bool enabled = true;
        std::string pattern = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    };

    struct FileConfig {
        bool enabled = false;
        std::string log_file = "logs/butterfly.log";
        int64_t max_file_size = 10485760;  // 10MB
        int max_files = 5;
        std::string pattern = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%";
    };

    LogLevel global_level = LogLevel::INFO;
    ConsoleConfig console;
    FileConfig file;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "log"; }

    static LogLevel level_from_string(const std::string& level_str);
    static std::string level_to_string(LogLevel level);
};

}  // namespace butterfly::log
