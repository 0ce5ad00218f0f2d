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

// Everything goes to stderr; stdout is reserved for command output and for
// image bytes when writing to "-".
class Logger {
public:
    static LogLevel level;

    static void setLevel(LogLevel newLevel) {
        level = newLevel;
    }

    static void debug(const std::string& msg) {
        write(LogLevel::DEBUG, ansi::gray, "[DEBUG] ", msg);
    }

    static void info(const std::string& msg) {
        write(LogLevel::INFO, ansi::white, "[INFO] ", msg);
    }

    static void warn(const std::string& msg) {
        write(LogLevel::WARN, ansi::yellow, "[WARN] ", msg);
    }

    static void error(const std::string& msg) {
        write(LogLevel::ERROR, ansi::red, "[ERROR] ", msg);
    }

private:
    static void write(LogLevel msgLevel, const std::string& color,
                      const char* tag, const std::string& msg) {
        if (level >= msgLevel) {
            std::cerr << color << tag << msg << ansi::reset << "\n";
        }
    }
};
