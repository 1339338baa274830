#include "linerpc/logger.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/consoleappender.h>
#include <log4cplus/layout.h>
#include <log4cplus/loglevel.h>
#include <log4cplus/helpers/loglog.h>

namespace linerpc {

log4cplus::Logger& server_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("linerpc"));
    return logger;
}

log4cplus::Logger& dispatch_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("linerpc.dispatch"));
    return logger;
}

log4cplus::Logger& transport_logger() {
    static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("linerpc.transport"));
    return logger;
}

int parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return log4cplus::TRACE_LOG_LEVEL;
    if (lower == "debug") return log4cplus::DEBUG_LOG_LEVEL;
    if (lower == "info")  return log4cplus::INFO_LOG_LEVEL;
    if (lower == "warn" || lower == "warning") return log4cplus::WARN_LOG_LEVEL;
    if (lower == "error") return log4cplus::ERROR_LOG_LEVEL;
    if (lower == "fatal") return log4cplus::FATAL_LOG_LEVEL;
    if (lower == "off")   return log4cplus::OFF_LOG_LEVEL;
    throw std::invalid_argument("Unknown log level: " + name);
}

static void configure_stderr() {
    // stdout is the protocol channel
    log4cplus::SharedAppenderPtr appender(new log4cplus::ConsoleAppender(true, true));
    appender->setName(LOG4CPLUS_TEXT("stderr"));
    appender->setLayout(std::unique_ptr<log4cplus::Layout>(new log4cplus::PatternLayout(
        LOG4CPLUS_TEXT("%D{%Y-%m-%d %H:%M:%S} - %c - %p - %m%n"))));

    log4cplus::Logger root = log4cplus::Logger::getRoot();
    root.removeAllAppenders();
    root.addAppender(appender);
    root.setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

void init_logging(const std::string& config_path, const std::string& level) {
    bool configured = false;
    if (!config_path.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(config_path, ec)) {
            log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(config_path));
            configured = true;
        } else {
            log4cplus::helpers::LogLog::getLogLog()->warn(
                LOG4CPLUS_TEXT("Logging config not found, using stderr defaults"));
        }
    }

    if (!configured) {
        configure_stderr();
    }

    if (!level.empty()) {
        log4cplus::Logger::getRoot().setLogLevel(parse_log_level(level));
    }
}

} // namespace linerpc
