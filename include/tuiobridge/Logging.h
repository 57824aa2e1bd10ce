/*
 *  TuioBridge - WebSocket JSON to OSC/TUIO relay.
 *  Leveled process logging shared by every connection thread.
 */

#pragma once

#include <functional>
#include <string>

namespace tuiobridge {

    // Log levels
    enum class LogLevel {
        Error = 0,    // Critical errors (always logged)
        Warning = 1,  // Warnings (always logged)
        Info = 2,     // Informational messages (default)
        Debug = 3     // Debug messages (logged if debug enabled)
    };

    /**
     * @brief Callback notified for every emitted log line
     */
    using LogCallback = std::function<void(LogLevel level, const std::string &message)>;

    class Logging {
       public:
        /**
         * @brief Set the maximum level that is emitted
         */
        static void setLevel(LogLevel level);

        static LogLevel getLevel();

        /**
         * @brief Enable or disable debug logging
         *
         * @param enabled true raises the level to Debug, false resets it to Info
         * @return Previous state
         */
        static bool setDebug(bool enabled);

        /**
         * @brief Check whether a message at this level would be emitted
         */
        static bool isEnabled(LogLevel level);

        /**
         * @brief Log a message
         *
         * Lines are written as "YYYY-MM-DD HH:MM:SS - LEVEL - message"; errors and
         * warnings go to stderr, everything else to stdout.
         */
        static void message(LogLevel level, const std::string &text);

        /**
         * @brief Install a callback that also receives each emitted line
         * @param callback Callback, or nullptr to remove it
         */
        static void setCallback(LogCallback callback);

        static const char *levelName(LogLevel level);
    };

    // Convenience functions
    inline void logError(const std::string &text) { Logging::message(LogLevel::Error, text); }
    inline void logWarning(const std::string &text) { Logging::message(LogLevel::Warning, text); }
    inline void logInfo(const std::string &text) { Logging::message(LogLevel::Info, text); }
    inline void logDebug(const std::string &text) { Logging::message(LogLevel::Debug, text); }

}  // namespace tuiobridge
