/**
 * @file ilogger.cpp
 * @brief Уровни логирования и форматирование времени
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/ilogger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::mutex& procguard::TimeFormatter::formatMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string& procguard::TimeFormatter::globalFormat() {
    static std::string fmt = "%Y-%m-%d %T";
    return fmt;
}

bool procguard::TimeFormatter::setGlobalFormat(const std::string& fmt) {
    if (fmt.empty()) {
        std::cerr << "Ошибка формата времени: пустая строка формата" << std::endl;
        return false;
    }
    std::lock_guard<std::mutex> lock(formatMutex());
    globalFormat() = fmt;
    return true;
}

std::string procguard::TimeFormatter::format(
    const std::chrono::system_clock::time_point& tp) {
    try {
        auto now_time = std::chrono::system_clock::to_time_t(tp);
        std::tm now_tm{};
        localtime_r(&now_time, &now_tm);

        std::string fmt;
        {
            std::lock_guard<std::mutex> lock(formatMutex());
            fmt = globalFormat();
        }

        std::ostringstream oss;
        oss << std::put_time(&now_tm, fmt.c_str());
        return oss.str();
    } catch (const std::exception&) {
        return "[INVALID_TIME]";
    }
}

void procguard::ILogger::setLogLevel(LogLevel level) {
    currentLevel_.store(level, std::memory_order_release);
}

procguard::LogLevel procguard::ILogger::getLogLevel() const {
    return currentLevel_.load(std::memory_order_acquire);
}

void procguard::ILogger::debug(const std::string& message) {
    log(procguard::LogLevel::LOG_DEBUG, message);
}

void procguard::ILogger::info(const std::string& message) {
    log(procguard::LogLevel::LOG_INFO, message);
}

void procguard::ILogger::warning(const std::string& message) {
    log(procguard::LogLevel::LOG_WARNING, message);
}

void procguard::ILogger::error(const std::string& message) {
    log(procguard::LogLevel::LOG_ERROR, message);
}

void procguard::ILogger::critical(const std::string& message) {
    log(procguard::LogLevel::LOG_CRITICAL, message);
}

bool procguard::ILogger::shouldSkipLog(LogLevel level) const {
    return static_cast<int>(level) <
           static_cast<int>(currentLevel_.load(std::memory_order_acquire));
}

std::string procguard::ILogger::formatLine(LogLevel level,
                                           const std::string& message) {
    std::ostringstream formatted;
    formatted << TimeFormatter::format(std::chrono::system_clock::now()) << " ["
              << leveltoString(level) << "] " << message;
    return formatted.str();
}

std::string procguard::leveltoString(LogLevel level) {
    std::string level_;
    switch (level) {
        case LogLevel::LOG_DEBUG:
            level_ = "DEBUG";
            break;
        case LogLevel::LOG_INFO:
            level_ = "INFO";
            break;
        case LogLevel::LOG_WARNING:
            level_ = "WARNING";
            break;
        case LogLevel::LOG_ERROR:
            level_ = "ERROR";
            break;
        case LogLevel::LOG_CRITICAL:
            level_ = "CRITICAL";
            break;
        default:
            break;
    }
    return level_;
}

procguard::LogLevel procguard::stringToLogLevel(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "debug") return LogLevel::LOG_DEBUG;
    if (lowered == "info") return LogLevel::LOG_INFO;
    if (lowered == "warning" || lowered == "warn") return LogLevel::LOG_WARNING;
    if (lowered == "error") return LogLevel::LOG_ERROR;
    if (lowered == "critical") return LogLevel::LOG_CRITICAL;

    throw std::invalid_argument("Unknown log level: " + name);
}
