#include "mcpmux/util/log.hpp"

#include <algorithm>
#include <cctype>

namespace mcpmux::util
{

LogLevel log_level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return LogLevel::Debug;
    if (upper == "WARNING" || upper == "WARN")
        return LogLevel::Warning;
    if (upper == "ERROR" || upper == "CRITICAL")
        return LogLevel::Error;
    if (upper == "OFF" || upper == "NONE")
        return LogLevel::Off;
    return LogLevel::Info;
}

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "INFO";
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::enabled(LogLevel level) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return level != LogLevel::Off && level >= level_ && sink_ != nullptr;
}

void Logger::set_sink(std::ostream* sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Off || level < level_ || sink_ == nullptr)
        return;
    *sink_ << "[mcpmux] " << to_string(level) << " [" << component << "] " << message << "\n";
    sink_->flush();
}

} // namespace mcpmux::util
