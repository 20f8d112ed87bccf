// tests/log/test_logger.cpp
#define BOOST_TEST_MODULE LoggerTests
#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/smart_ptr/make_shared.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>
#include <boost/test/unit_test.hpp>
#include <memory>
#include <sstream>  // for capturing log output
#include <string>

#include "butterfly/di/container.hpp"
#include "butterfly/log/log_config.hpp"
#include "butterfly/log/logger.hpp"

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

namespace bflog = butterfly::log;
namespace di = butterfly::di;

// Sink backend writing into a stringstream
class StringStreamBackend : public sinks::text_ostream_backend {
public:
    explicit StringStreamBackend(std::ostream& os) {
        add_stream(boost::shared_ptr<std::ostream>(&os, boost::null_deleter()));
    }
};

// Captures everything logged during one test case
struct LogFixture {
    LogFixture() {
        logging::core::get()->remove_all_sinks();

        sink = boost::make_shared<sinks::synchronous_sink<StringStreamBackend>>(
            boost::make_shared<StringStreamBackend>(stream));
        sink->set_formatter(expr::stream
                            << expr::attr<logging::trivial::severity_level>(
                                   "Severity")
                            << ": " << expr::smessage);
        logging::core::get()->add_sink(sink);

        set_minimum(logging::trivial::trace);
        logging::add_common_attributes();
    }

    ~LogFixture() {
        logging::core::get()->remove_sink(sink);
        sink.reset();
    }

    static void set_minimum(logging::trivial::severity_level level) {
        logging::core::get()->set_filter(
            expr::attr<logging::trivial::severity_level>("Severity") >= level);
    }

    bool logged(const std::string& text) const {
        sink->flush();
        return stream.str().find(text) != std::string::npos;
    }

    std::stringstream stream;
    boost::shared_ptr<sinks::synchronous_sink<StringStreamBackend>> sink;
};

BOOST_FIXTURE_TEST_SUITE(LoggerTestSuite, LogFixture)

BOOST_AUTO_TEST_CASE(test_log_info_message) {
    BUTTERFLY_LOG_INFO << "This is an info message.";
    BOOST_CHECK(logged("info: This is an info message."));
}

BOOST_AUTO_TEST_CASE(test_log_debug_message) {
    BUTTERFLY_LOG_DEBUG << "This is a debug message.";
    BOOST_CHECK(logged("debug: This is a debug message."));
}

BOOST_AUTO_TEST_CASE(test_log_level_filtering) {
    bflog::Logger::set_level(bflog::LogConfig::LogLevel::WARN);

    BUTTERFLY_LOG_INFO << "This info message should not appear.";
    BUTTERFLY_LOG_WARN << "This warning message should appear.";
    BUTTERFLY_LOG_ERROR << "This error message should also appear.";

    BOOST_CHECK(!logged("info: This info message should not appear."));
    BOOST_CHECK(logged("warning: This warning message should appear."));
    BOOST_CHECK(logged("error: This error message should also appear."));
}

BOOST_AUTO_TEST_CASE(test_level_from_string) {
    BOOST_CHECK(bflog::Logger::level_from_string("TRACE") ==
                bflog::LogConfig::LogLevel::TRACE);
    BOOST_CHECK(bflog::Logger::level_from_string("warning") ==
                bflog::LogConfig::LogLevel::WARN);
    BOOST_CHECK(bflog::Logger::level_from_string("critical") ==
                bflog::LogConfig::LogLevel::FATAL);
    BOOST_CHECK_THROW(bflog::Logger::level_from_string("verbose"),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_logger_init_shutdown) {
    bflog::LogConfig config;
    config.global_level = bflog::LogConfig::LogLevel::INFO;
    config.console.enabled = false;

    bflog::Logger::init(config);
    BOOST_CHECK(logged("info: Logger initialized, level info"));

    bflog::Logger::shutdown();
    BOOST_CHECK(logged("info: Logger shutting down"));
}

BOOST_AUTO_TEST_CASE(test_container_lifecycle_logged) {
    auto types = std::make_shared<di::TypeRegistry>();
    types->add_type<std::string>("String").constructor<std::string>();

    di::Container container(types);
    container.register_singleton(
        "greeting", di::FactoryChain().construct("String", {di::lit("hi")}));
    BOOST_CHECK(logged("debug: Registered singleton 'greeting'"));

    container.resolve("greeting");
    BOOST_CHECK(logged("debug: Cached singleton 'greeting' (version 1)"));

    container.replace("greeting",
                      di::FactoryChain().construct("String", {di::lit("yo")}));
    BOOST_CHECK(logged("info: Replaced 'greeting' (version 2)"));

    BOOST_CHECK_THROW(container.resolve("missing"), di::UnknownBindingError);
    BOOST_CHECK(logged("error: Cannot resolve 'missing'"));

    container.shutdown();
    BOOST_CHECK(logged("info: Container shut down"));
}

BOOST_AUTO_TEST_SUITE_END()
