#pragma once

#include <iostream>
#include <string>
#include <iomanip>
#include <mutex>
#include <atomic>

namespace Twinscan {

/**
 * @brief Thread-safe logging utility for the similarity core.
 *
 * Detectors run on OpenMP workers, so every line is written under one lock.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error,
        Silent
    };

    /**
     * @brief Drop every message below this level (tests set Level::Error).
     */
    static void set_min_level(Level level) {
        min_level().store(level, std::memory_order_relaxed);
    }

    static Level get_min_level() {
        return min_level().load(std::memory_order_relaxed);
    }

    static void log(Level level, const std::string& message) {
        if (level == Level::Silent) return;
        if (static_cast<int>(level) < static_cast<int>(get_min_level())) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break; // Red
            case Level::Silent:  break;
        }

        std::ostream& out = (level == Level::Warning || level == Level::Error) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }
};

} // namespace Twinscan
