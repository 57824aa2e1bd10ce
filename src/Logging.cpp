#include "tuiobridge/Logging.h"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tuiobridge {

    namespace {
        std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
        std::mutex g_logMutex;  // guards the streams and g_callback
        LogCallback g_callback;

        std::string timestamp() {
            auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm local{};
            localtime_r(&now, &local);
            std::ostringstream oss;
            oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
            return oss.str();
        }
    }  // namespace

    void Logging::setLevel(LogLevel level) { g_level.store(static_cast<int>(level)); }

    LogLevel Logging::getLevel() { return static_cast<LogLevel>(g_level.load()); }

    bool Logging::setDebug(bool enabled) {
        bool previous = isEnabled(LogLevel::Debug);
        setLevel(enabled ? LogLevel::Debug : LogLevel::Info);
        return previous;
    }

    bool Logging::isEnabled(LogLevel level) {
        return static_cast<int>(level) <= g_level.load();
    }

    const char *Logging::levelName(LogLevel level) {
        switch (level) {
            case LogLevel::Error:
                return "ERROR";
            case LogLevel::Warning:
                return "WARNING";
            case LogLevel::Info:
                return "INFO";
            case LogLevel::Debug:
                return "DEBUG";
        }
        return "UNKNOWN";
    }

    void Logging::message(LogLevel level, const std::string &text) {
        if (!isEnabled(level)) {
            return;
        }

        std::string line = timestamp() + " - " + levelName(level) + " - " + text;

        LogCallback callback;
        {
            std::lock_guard<std::mutex> lock(g_logMutex);
            if (level == LogLevel::Error || level == LogLevel::Warning) {
                std::cerr << line << std::endl;
            } else {
                std::cout << line << std::endl;
            }
            callback = g_callback;
        }

        // Called unlocked so the callback may log
        if (callback) {
            callback(level, text);
        }
    }

    void Logging::setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(g_logMutex);
        g_callback = std::move(callback);
    }

}  // namespace tuiobridge
