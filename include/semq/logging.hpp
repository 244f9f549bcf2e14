#ifndef SEMQ_LOGGING_HPP
#define SEMQ_LOGGING_HPP

#include <functional>
#include <optional>
#include <string>

namespace semq
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error
};

/// Callback receiving every diagnostic emitted by a stream.
/// @param level Severity of the message
/// @param message Single line of text (without trailing newline)
using LogCallback = std::function<void(LogLevel level, const std::string& message)>;

const char* to_string(LogLevel level);

// Routes diagnostics to the user callback when one is configured, otherwise
// warnings and errors go to stderr and debug output only when SEMQ_DEBUG is set.
class Logger
{
  public:
    Logger() = default;
    explicit Logger(std::optional<LogCallback> callback);

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const
    {
        log(LogLevel::Debug, message);
    }
    void warning(const std::string& message) const
    {
        log(LogLevel::Warning, message);
    }

    // True when a Debug message would be delivered somewhere
    bool debug_enabled() const;

  private:
    std::optional<LogCallback> callback_;
    bool env_debug_ = debug_from_env();

    static bool debug_from_env();
};

} // namespace semq

#endif // SEMQ_LOGGING_HPP
