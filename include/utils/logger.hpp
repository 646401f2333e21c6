#pragma once

#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <iomanip>
#include <mutex>
#include <chrono>
#include <ctime>
#include <unistd.h>

namespace Roster {

/**
 * @brief Thread-safe logging utility.
 *
 * Writes colored lines to stdout and, once set_file() has been called,
 * plain "<pid> <timestamp> <LEVEL> <message>" lines to a log file.
 */
class Logger {
public:
    enum class Level {
        Info,
        Step,
        Success,
        Warning,
        Error
    };

    static void log(Level level, const std::string& message) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);

        const char* color = "";
        const char* prefix = "";
        const char* name = "";

        switch (level) {
            case Level::Info:    color = "\033[0;36m"; prefix = "=== "; name = "INFO";    break; // Cyan
            case Level::Step:    color = "\033[1;33m"; prefix = ">>> "; name = "INFO";    break; // Yellow
            case Level::Success: color = "\033[0;32m"; prefix = "✓ ";   name = "INFO";    break; // Green
            case Level::Warning: color = "\033[1;33m"; prefix = "⚠ ";   name = "WARNING"; break; // Yellow
            case Level::Error:   color = "\033[0;31m"; prefix = "✗ ";   name = "ERROR";   break; // Red
        }

        if (s.console) {
            std::ostream& out = (level == Level::Error) ? std::cerr : std::cout;
            out << color << prefix << message << "\033[0m" << std::endl;
        }

        if (s.file.is_open()) {
            s.file << ::getpid() << ' ' << timestamp() << ' ' << name << ' ' << message << '\n';
            s.file.flush();
        }
    }

    /**
     * @brief Route log lines to a file as well (truncates it).
     * @return false if the file could not be opened; console logging continues.
     */
    static bool set_file(const std::string& path) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open()) s.file.close();
        s.file.open(path, std::ios::out | std::ios::trunc);
        return s.file.is_open();
    }

    static void close_file() {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open()) s.file.close();
    }

    static void set_console(bool enabled) {
        State& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        s.console = enabled;
    }

    static void info(const std::string& msg)    { log(Level::Info, msg); }
    static void step(const std::string& msg)    { log(Level::Step, msg); }
    static void success(const std::string& msg) { log(Level::Success, msg); }
    static void warn(const std::string& msg)    { log(Level::Warning, msg); }
    static void error(const std::string& msg)   { log(Level::Error, msg); }

private:
    struct State {
        std::mutex mutex;
        std::ofstream file;
        bool console = true;
    };

    static State& state() {
        static State s;
        return s;
    }

    // "2026-10-18 13:29:01,123"
    static std::string timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm tm{};
        localtime_r(&t, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ','
           << std::setw(3) << std::setfill('0') << ms;
        return ss.str();
    }
};

} // namespace Roster
