/**
 * @file consolelogger.cpp
 * @brief Реализация ConsoleLogger
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/consolelogger.hpp"

procguard::ConsoleLogger::ConsoleLogger(std::ostream& out, bool colored)
    : out_(out), colored_(colored) {}

void procguard::ConsoleLogger::init(const LogLevel level) {
    setLogLevel(level);
}

void procguard::ConsoleLogger::setColored(bool colored) {
    std::lock_guard<std::mutex> lock(mutex_);
    colored_ = colored;
}

void procguard::ConsoleLogger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

void procguard::ConsoleLogger::log(LogLevel level, const std::string& message) {
    if (shouldSkipLog(level)) return;

    std::string formattedMsg;
    try {
        formattedMsg = formatLine(level, message);
    } catch (const std::exception& e) {
        formattedMsg = "[LOGGER ERROR: " + std::string(e.what()) + "] " + message;
    }

    std::lock_guard lock(mutex_);
    if (colored_) {
        out_ << colorCode(level) << formattedMsg << ANSI_COLOR_RESET << '\n';
    } else {
        out_ << formattedMsg << '\n';
    }
    out_.flush();
}

const char* procguard::ConsoleLogger::colorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::LOG_DEBUG:
            return "\033[36m";  // Cyan
        case LogLevel::LOG_INFO:
            return "\033[32m";  // Green
        case LogLevel::LOG_WARNING:
            return "\033[33m";  // Yellow
        case LogLevel::LOG_ERROR:
            return "\033[31m";  // Red
        case LogLevel::LOG_CRITICAL:
            return "\033[41m\033[37m";  // White on Red
        default:
            return ANSI_COLOR_RESET;
    }
}
