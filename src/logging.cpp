#include <cstdlib>
#include <iostream>
#include <semq/logging.hpp>

namespace semq
{

const char* to_string(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Debug:
        return "Debug";
    case LogLevel::Info:
        return "Info";
    case LogLevel::Warning:
        return "Warning";
    case LogLevel::Error:
        return "Error";
    }
    return "Unknown";
}

Logger::Logger(std::optional<LogCallback> callback) : callback_(std::move(callback)) {}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (callback_.has_value() && *callback_)
    {
        (*callback_)(level, message);
        return;
    }

    if (level == LogLevel::Warning || level == LogLevel::Error || env_debug_)
        std::cerr << to_string(level) << ": " << message << std::endl;
}

bool Logger::debug_enabled() const
{
    return (callback_.has_value() && *callback_) || env_debug_;
}

bool Logger::debug_from_env()
{
    const char* value = std::getenv("SEMQ_DEBUG");
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}

} // namespace semq
