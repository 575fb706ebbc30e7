#include "logger.hpp"

StreamLogger::StreamLogger(LogLevel minLevel, std::ostream& out, std::ostream& err)
    : minLevel_(minLevel), out_(out), err_(err) {}

void StreamLogger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    minLevel_ = level;
}

void StreamLogger::log(LogLevel level, const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < minLevel_) return;

    switch (level) {
        case LogLevel::Debug:
            out_ << "[" << tag << "] (debug) " << message << "\n";
            break;
        case LogLevel::Info:
            out_ << "[" << tag << "] " << message << "\n";
            break;
        case LogLevel::Warn:
            err_ << "[" << tag << "] Warning: " << message << "\n";
            break;
        case LogLevel::Error:
            err_ << "[" << tag << "] Error: " << message << "\n";
            break;
    }
}

Logger& defaultLogger() {
    static StreamLogger logger;
    return logger;
}
