/**
 * @file compositelogger.hpp
 * @brief Логгер, рассылающий сообщения нескольким логгерам
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include "procguard/ilogger.hpp"

#include <initializer_list>
#include <memory>
#include <vector>

namespace procguard {

/**
 * @class CompositeLogger
 * @brief Рассылает каждое сообщение во все вложенные логгеры
 *
 * @note Фильтрация по уровню выполняется вложенными логгерами.
 */
class CompositeLogger : public ILogger {
public:
    CompositeLogger() = default;
    CompositeLogger(std::initializer_list<std::shared_ptr<ILogger>> loggers)
        : loggers_(loggers) {}

    void addLogger(const std::shared_ptr<ILogger>& logger);
    std::size_t size() const { return loggers_.size(); }

    void init(const LogLevel level) override;
    void setLogLevel(LogLevel level) override;
    void flush() override;

    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;
    void critical(const std::string& message) override;

protected:
    bool shouldSkipLog(LogLevel level) const override;
    void log(LogLevel level, const std::string& message) override;

private:
    std::vector<std::shared_ptr<ILogger>> loggers_;
};

}  // namespace procguard
