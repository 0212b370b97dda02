/**
 * @file compositelogger.cpp
 * @brief Реализация CompositeLogger
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/compositelogger.hpp"

namespace procguard {

void CompositeLogger::addLogger(const std::shared_ptr<ILogger>& logger) {
    if (logger) loggers_.push_back(logger);
}

void CompositeLogger::init(const LogLevel level) {
    ILogger::setLogLevel(level);
    for (auto& logger : loggers_) {
        logger->init(level);
    }
}

void CompositeLogger::setLogLevel(LogLevel level) {
    ILogger::setLogLevel(level);
    for (auto& logger : loggers_) {
        logger->setLogLevel(level);
    }
}

void CompositeLogger::flush() {
    for (auto& logger : loggers_) {
        logger->flush();
    }
}

void CompositeLogger::debug(const std::string& message) {
    log(LogLevel::LOG_DEBUG, message);
}

void CompositeLogger::info(const std::string& message) {
    log(LogLevel::LOG_INFO, message);
}

void CompositeLogger::warning(const std::string& message) {
    log(LogLevel::LOG_WARNING, message);
}

void CompositeLogger::error(const std::string& message) {
    log(LogLevel::LOG_ERROR, message);
}

void CompositeLogger::critical(const std::string& message) {
    log(LogLevel::LOG_CRITICAL, message);
}

void CompositeLogger::log(LogLevel level, const std::string& message) {
    for (auto& logger : loggers_) {
        switch (level) {
            case LogLevel::LOG_DEBUG:
                logger->debug(message);
                break;
            case LogLevel::LOG_INFO:
                logger->info(message);
                break;
            case LogLevel::LOG_WARNING:
                logger->warning(message);
                break;
            case LogLevel::LOG_ERROR:
                logger->error(message);
                break;
            case LogLevel::LOG_CRITICAL:
                logger->critical(message);
                break;
        }
    }
}

bool CompositeLogger::shouldSkipLog(LogLevel) const {
    // фильтрацию выполняют вложенные логгеры
    return false;
}

}  // namespace procguard
