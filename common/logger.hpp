#pragma once
#include <iostream>
#include <mutex>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

// Log sink handed to components at construction, so none of them
// prints to the console on its own.
class Logger {
public:
    virtual ~Logger() = default;
    virtual void log(LogLevel level, const std::string& tag, const std::string& message) = 0;

    void debug(const std::string& tag, const std::string& message) { log(LogLevel::Debug, tag, message); }
    void info(const std::string& tag, const std::string& message) { log(LogLevel::Info, tag, message); }
    void warn(const std::string& tag, const std::string& message) { log(LogLevel::Warn, tag, message); }
    void error(const std::string& tag, const std::string& message) { log(LogLevel::Error, tag, message); }
};

// Writes "[Tag] message" lines, warnings and errors go to the error stream.
class StreamLogger : public Logger {
public:
    explicit StreamLogger(LogLevel minLevel = LogLevel::Info,
                          std::ostream& out = std::cout,
                          std::ostream& err = std::cerr);

    void log(LogLevel level, const std::string& tag, const std::string& message) override;
    void setMinLevel(LogLevel level);

private:
    LogLevel minLevel_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&, const std::string&) override {}
};

// Process wide StreamLogger at Info level.
Logger& defaultLogger();
