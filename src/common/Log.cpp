#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

#include "domain/Errors.hpp"

namespace mdc::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;

constexpr const char* kLevelLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

std::ostream& streamFor(Level level) {
    return (level == Level::Warn || level == Level::Error) ? std::cerr : std::cout;
}

// Log lines carry UTC like every timestamp the engine handles.
std::tm utcTime(std::time_t time) {
    std::tm tm{};
    gmtime_r(&time, &tm);
    return tm;
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void log(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto tm = utcTime(seconds);

    std::ostringstream line;
    line << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3)
         << std::setfill('0') << millis.count() << "] [" << levelToString(level) << "] [thread "
         << std::this_thread::get_id() << "] " << message;

    std::lock_guard<std::mutex> lock(g_outputMutex);
    streamFor(level) << line.str() << std::endl;
}

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < sizeof(kLevelLabels) / sizeof(kLevelLabels[0])) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug" || lower == "trace") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw domain::ConfigError("Unknown log level: " + std::string{text});
}

}  // namespace mdc::log
