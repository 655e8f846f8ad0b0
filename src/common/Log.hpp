#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace mdc::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace mdc::log

#define MDC_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::mdc::log::shouldLog(level)) {                                                \
            std::ostringstream mdc_log_stream__;                                           \
            mdc_log_stream__ << expr;                                                      \
            ::mdc::log::log(level, mdc_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) MDC_LOG_IMPL(::mdc::log::Level::Debug, expr)
#define LOG_INFO(expr) MDC_LOG_IMPL(::mdc::log::Level::Info, expr)
#define LOG_WARN(expr) MDC_LOG_IMPL(::mdc::log::Level::Warn, expr)
#define LOG_ERR(expr) MDC_LOG_IMPL(::mdc::log::Level::Error, expr)
