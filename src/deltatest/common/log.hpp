/**
 * @file log.hpp
 * @brief Module-tagged logging for deltatest.
 *
 * @details
 * Log output goes to stderr so that it never mixes with reporter output on
 * stdout (which may be JSON). Messages are built with stream syntax and only
 * formatted when the level is enabled:
 *
 * @code
 * DELTATEST_LOG_DEBUG("graph", "built graph with " << units.size() << " units");
 * DELTATEST_LOG_WARN("vcs", "ignoring unparsable status entry: " << entry);
 * @endcode
 */
#pragma once
#include "deltatest/common/common.hpp"
#include <atomic>
#include <mutex>
#include <sstream>

namespace deltatest
{

/**
 * @brief Log severity levels in ascending order.
 */
enum class LogLevel : int
{
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

/**
 * @brief Upper-case name of a level ("TRACE", "DEBUG", ...).
 */
const char* level_name(LogLevel level) noexcept;

/**
 * @brief Parse a level name (case-insensitive).
 * @return The level, or `std::nullopt` if the name is not recognized.
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief A single log message with metadata.
 */
struct LogRecord
{
    LogLevel level;
    std::string module;
    std::string message;
    std::chrono::system_clock::time_point time;
};

/**
 * @brief Destination for log records.
 */
class LogSink
{
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
};

/**
 * @brief Sink writing `HH:MM:SS.mmm LEVEL [module] message` lines to stderr.
 *
 * @details
 * The level name is colored when stderr is a terminal.
 */
class StderrSink : public LogSink
{
public:
    StderrSink();

    void write(const LogRecord& record) override;

private:
    bool m_colors;
};

/**
 * @brief Process-wide logger.
 *
 * @par Thread safety
 * - `log()` and `set_sink()` are serialized by an internal mutex.
 * - The level is read without locking on the fast path.
 */
class Logger
{
public:
    static Logger& instance();

    bool should_log(LogLevel level) const noexcept
    {
        LogLevel current = m_level.load(std::memory_order_relaxed);
        return current != LogLevel::Off && level >= current;
    }

    LogLevel level() const noexcept
    {
        return m_level.load(std::memory_order_relaxed);
    }

    void set_level(LogLevel level) noexcept
    {
        m_level.store(level, std::memory_order_relaxed);
    }

    /**
     * @brief Replace the active sink.
     * @return The previously active sink, so callers (tests) can restore it.
     */
    std::unique_ptr<LogSink> set_sink(std::unique_ptr<LogSink> sink);

    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::atomic<LogLevel> m_level{LogLevel::Warn};
    std::unique_ptr<LogSink> m_sink;
    std::mutex m_mutex;
};

} // namespace deltatest

#define DELTATEST_LOG_IMPL(level, module, msg)                                 \
    do                                                                         \
    {                                                                          \
        auto& logger_ = ::deltatest::Logger::instance();                       \
        if (logger_.should_log(level))                                         \
        {                                                                      \
            std::ostringstream oss_;                                           \
            oss_ << msg;                                                       \
            logger_.log(level, module, oss_.str());                            \
        }                                                                      \
    } while (0)

#define DELTATEST_LOG_TRACE(module, msg) DELTATEST_LOG_IMPL(::deltatest::LogLevel::Trace, module, msg)
#define DELTATEST_LOG_DEBUG(module, msg) DELTATEST_LOG_IMPL(::deltatest::LogLevel::Debug, module, msg)
#define DELTATEST_LOG_INFO(module, msg) DELTATEST_LOG_IMPL(::deltatest::LogLevel::Info, module, msg)
#define DELTATEST_LOG_WARN(module, msg) DELTATEST_LOG_IMPL(::deltatest::LogLevel::Warn, module, msg)
#define DELTATEST_LOG_ERROR(module, msg) DELTATEST_LOG_IMPL(::deltatest::LogLevel::Error, module, msg)
