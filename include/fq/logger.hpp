#pragma once

#include <format>
#include <mutex>
#include <string_view>
#include <utility>

namespace fq
{
enum class LogLevel { Error = 0, Warn, Info, Debug };

const char *level_str(LogLevel level);

// Leveled diagnostics sink. Implementations must accept concurrent calls
// because every upstream worker logs from its own thread.
class Logger
{
public:
    explicit Logger(LogLevel threshold = LogLevel::Warn) : threshold_(threshold) {}
    virtual ~Logger() = default;

    void set_threshold(LogLevel level) { threshold_ = level; }
    LogLevel threshold() const { return threshold_; }
    bool enabled(LogLevel level) const { return level <= threshold_; }

    template <typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args &&...args)
    {
        if (!enabled(level)) return;
        write(level, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args &&...args)
    {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

protected:
    virtual void write(LogLevel level, std::string_view msg) = 0;

private:
    LogLevel threshold_;
};

// "[fanq] WARN message" lines on stderr
class StderrLogger : public Logger
{
public:
    using Logger::Logger;

protected:
    void write(LogLevel level, std::string_view msg) override;

private:
    std::mutex mtx_;
};

class NullLogger : public Logger
{
public:
    NullLogger() : Logger(LogLevel::Error) {}

protected:
    void write(LogLevel, std::string_view) override {}
};
} // namespace fq
