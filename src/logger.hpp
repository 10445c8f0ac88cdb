#pragma once
#include <iostream>
#include <string>

namespace ansi {
    const std::string reset   = "\033[0m";
    const std::string red     = "\033[31m";
    const std::string yellow  = "\033[33m";
    const std::string white   = "\033[37m";
    const std::string gray    = "\033[90m";
}

enum class LogLevel {
    NONE,
    ERROR,
    WARN,
    INFO,
    DEBUG
};

// Console logging for the scanner and the CLI. Everything goes to stderr so
// stdout stays free for the recovered-file listing.
class Logger {
public:
    static LogLevel level;

    static void setLevel(LogLevel newLevel) {
        level = newLevel;
    }

    // Lets hot paths skip building messages nobody will see
    static bool enabled(LogLevel wanted) {
        return wanted != LogLevel::NONE && level >= wanted;
    }

    static void debug(const std::string& msg) { emit(LogLevel::DEBUG, ansi::gray, "[DEBUG] ", msg); }
    static void info(const std::string& msg) { emit(LogLevel::INFO, ansi::white, "[INFO] ", msg); }
    static void warn(const std::string& msg) { emit(LogLevel::WARN, ansi::yellow, "[WARN] ", msg); }
    static void error(const std::string& msg) { emit(LogLevel::ERROR, ansi::red, "[ERROR] ", msg); }

private:
    static void emit(LogLevel wanted, const std::string& colour, const char* tag, const std::string& msg) {
        if (enabled(wanted))
            std::cerr << colour << tag << msg << ansi::reset << "\n";
    }
};
