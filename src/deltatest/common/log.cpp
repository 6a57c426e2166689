#include "deltatest/common/log.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <unistd.h>

namespace deltatest
{

const char* level_name(LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

std::optional<LogLevel> parse_log_level(const std::string& name)
{
    std::string lower;
    lower.reserve(name.size());
    for (char c : name)
    {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "trace")
        return LogLevel::Trace;
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off")
        return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// StderrSink
// ============================================================================

namespace
{

bool stderr_supports_color()
{
    if (!isatty(STDERR_FILENO))
    {
        return false;
    }
    if (std::getenv("NO_COLOR") != nullptr)
    {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string(term) != "dumb";
}

const char* level_color(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Off:
        return "";
    }
    return "";
}

std::string format_time(std::chrono::system_clock::time_point time)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      time.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count();
    return oss.str();
}

} // namespace

StderrSink::StderrSink()
    : m_colors{stderr_supports_color()}
{
}

void StderrSink::write(const LogRecord& record)
{
    std::ostringstream oss;
    oss << format_time(record.time) << ' ';
    if (m_colors)
    {
        oss << level_color(record.level);
    }
    oss << std::left << std::setw(5) << level_name(record.level);
    if (m_colors)
    {
        oss << "\033[0m";
    }
    oss << " [" << record.module << "] " << record.message << '\n';
    std::cerr << oss.str() << std::flush;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger()
    : m_sink{std::make_unique<StderrSink>()}
{
}

Logger& Logger::instance()
{
    static Logger logger;
    return logger;
}

std::unique_ptr<LogSink> Logger::set_sink(std::unique_ptr<LogSink> sink)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::swap(m_sink, sink);
    return sink;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message)
{
    LogRecord record{level, module, message, std::chrono::system_clock::now()};

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_sink)
    {
        m_sink->write(record);
    }
}

} // namespace deltatest
