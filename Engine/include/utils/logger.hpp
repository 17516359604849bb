#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace Lexigraph {

/**
 * @brief Thread-safe console logger for the engine.
 *
 * Messages below the current threshold are dropped. Warnings and errors go to
 * stderr, everything else to stdout.
 */
class Logger {
public:
    enum class Level {
        Bulk = 0,
        Info,
        Step,
        Success,
        Warning,
        Error,
        Quiet
    };

    static void log(Level level, const std::string& message) {
        if (level == Level::Quiet || level < threshold()) return;

        static std::mutex mutex;
        std::lock_guard<std::mutex> lock(mutex);

        const char* color = "";
        const char* prefix = "";

        switch (level) {
            case Level::Bulk:    color = "\033[0;35m"; prefix = "[LOAD] "; break; // Magenta
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; break;    // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; break;    // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   break;    // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   break;    // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   break;    // Red
            case Level::Quiet:   break;
        }

        std::ostream& out = (level >= Level::Warning) ? std::cerr : std::cout;
        out << color << prefix << message << "\033[0m" << std::endl;
    }

    static void set_threshold(Level level) { threshold_ref().store(level); }
    static Level threshold() { return threshold_ref().load(); }

    static void bulk(const std::string& msg)    { log(Level::Bulk, msg); }
    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    static std::atomic<Level>& threshold_ref() {
        static std::atomic<Level> level{Level::Info};
        return level;
    }
};

} // namespace Lexigraph
