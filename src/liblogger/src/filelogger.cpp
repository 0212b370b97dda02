/**
 * @file filelogger.cpp
 * @brief Реализация FileLogger
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/filelogger.hpp"

#include <iostream>
#include <utility>

namespace procguard {

FileLogger::FileLogger(std::string mainLogPath, std::string fallbackLogPath)
    : mainLogPath_(std::move(mainLogPath)),
      fallbackLogPath_(std::move(fallbackLogPath)) {
    if (fallbackLogPath_.empty()) {
        fallbackLogPath_ = mainLogPath_ + ".fallback";
    }
}

FileLogger::~FileLogger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mainLogFile_.is_open()) mainLogFile_.flush();
    if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void FileLogger::init(const LogLevel level) {
    setLogLevel(level);
    reopen();
}

void FileLogger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mainLogFile_.is_open()) mainLogFile_.flush();
    if (fallbackLogFile_.is_open()) fallbackLogFile_.flush();
}

void FileLogger::reopen() {
    std::lock_guard<std::mutex> lock(mutex_);
    reopenLocked();
}

void FileLogger::reopenLocked() {
    if (mainLogFile_.is_open()) {
        mainLogFile_.close();
    }
    if (fallbackLogFile_.is_open()) {
        fallbackLogFile_.close();
    }

    mainLogFile_.open(mainLogPath_, std::ios::app);
    if (mainLogFile_.is_open()) return;

    std::cerr << "[LOGGER ERROR] Cannot open main log file: " << mainLogPath_
              << std::endl;

    fallbackLogFile_.open(fallbackLogPath_, std::ios::app);
    if (!fallbackLogFile_.is_open()) {
        std::cerr << "[LOGGER ERROR] Cannot open fallback log file: "
                  << fallbackLogPath_ << std::endl;
    }
}

void FileLogger::log(LogLevel level, const std::string& message) {
    if (shouldSkipLog(level)) return;

    std::string line = formatLine(level, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!mainLogFile_.is_open() && !fallbackLogFile_.is_open()) {
        reopenLocked();
    }

    std::ofstream& target =
        mainLogFile_.is_open() ? mainLogFile_ : fallbackLogFile_;
    if (!target.is_open()) {
        std::cerr << line << std::endl;
        return;
    }

    target << line << '\n';
    target.flush();
    if (!target.good()) {
        std::cerr << "[LOGGER ERROR] Write failed, message: " << line << std::endl;
    }
}

void FileLogger::setMainLogPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mainLogPath_ == path) return;
    mainLogPath_ = path;
    reopenLocked();
}

void FileLogger::setFallbackLogPath(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fallbackLogPath_ == path) return;
    fallbackLogPath_ = path;
    reopenLocked();
}

std::string FileLogger::getMainLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mainLogPath_;
}

std::string FileLogger::getFallbackLogPath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallbackLogPath_;
}

bool FileLogger::isMainOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mainLogFile_.is_open();
}

}  // namespace procguard
