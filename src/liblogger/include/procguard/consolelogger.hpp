/**
 * @file consolelogger.hpp
 * @brief Логгер в консоль с цветовой подсветкой уровней
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include "procguard/ilogger.hpp"

#include <iostream>
#include <ostream>

#define ANSI_COLOR_RESET "\033[0m"

namespace procguard {

/**
 * @class ConsoleLogger
 * @brief Логгер в поток терминала (по умолчанию std::cerr)
 *
 * @note После демонизации stderr перенаправлен, поэтому консольный логгер
 * имеет смысл только в foreground-режиме.
 */
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(std::ostream& out = std::cerr, bool colored = true);
    ~ConsoleLogger() override = default;

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;

    void init(const LogLevel level) override;
    void flush() override;

    void setColored(bool colored);

protected:
    void log(LogLevel level, const std::string& message) override;

private:
    const char* colorCode(LogLevel level) const;

    mutable std::mutex mutex_;
    std::ostream& out_;
    bool colored_;
};

}  // namespace procguard
