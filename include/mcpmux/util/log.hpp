#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace mcpmux::util
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Parse "DEBUG", "info", "WARN", ... Unknown names map to Info.
LogLevel log_level_from_string(const std::string& name);
const char* to_string(LogLevel level);

/// Leveled line logger writing to a caller-owned stream.
///
/// One Logger is shared (via shared_ptr) by a manager and every session it
/// creates; lines from different threads are never interleaved.
class Logger
{
  public:
    explicit Logger(LogLevel level = LogLevel::Info, std::ostream* sink = &std::cerr)
        : level_(level), sink_(sink)
    {
    }

    void set_level(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    /// Caller retains ownership; must outlive every log() call
    void set_sink(std::ostream* sink);

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message)
    {
        log(LogLevel::Debug, component, message);
    }
    void info(const std::string& component, const std::string& message)
    {
        log(LogLevel::Info, component, message);
    }
    void warning(const std::string& component, const std::string& message)
    {
        log(LogLevel::Warning, component, message);
    }
    void error(const std::string& component, const std::string& message)
    {
        log(LogLevel::Error, component, message);
    }

  private:
    mutable std::mutex mutex_;
    LogLevel level_;
    std::ostream* sink_;
};

using LoggerPtr = std::shared_ptr<Logger>;

inline LoggerPtr make_logger(const std::string& level_name, std::ostream* sink = &std::cerr)
{
    return std::make_shared<Logger>(log_level_from_string(level_name), sink);
}

} // namespace mcpmux::util
