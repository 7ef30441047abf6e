#include "fq/logger.hpp"

#include <cstdio>
#include <print>

namespace fq
{
const char *level_str(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

void StderrLogger::write(LogLevel level, std::string_view msg)
{
    std::lock_guard<std::mutex> lk(mtx_);
    std::println(stderr, "[fanq] {} {}", level_str(level), msg);
}
} // namespace fq
