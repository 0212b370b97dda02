/**
 * @file ilogger.hpp
 * @brief Интерфейс ILogger и вспомогательные компоненты логирования.
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Логгеры procguard не являются синглтонами: приложение создаёт
 * их само и передаёт компонентам как зависимости.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>

namespace procguard {

enum class LogLevel {
    LOG_DEBUG,
    LOG_INFO,
    LOG_WARNING,
    LOG_ERROR,
    LOG_CRITICAL
};

class TimeFormatter {
public:
    /**
     * @brief Установить формат времени (синтаксис strftime)
     * @return false, если формат не удалось применить
     */
    static bool setGlobalFormat(const std::string& fmt);

    static std::string format(const std::chrono::system_clock::time_point& tp);

private:
    static std::mutex& formatMutex();
    static std::string& globalFormat();
};

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void init(const LogLevel level) = 0;

    virtual void setLogLevel(LogLevel level);
    virtual LogLevel getLogLevel() const;

    virtual void debug(const std::string& message);
    virtual void info(const std::string& message);
    virtual void warning(const std::string& message);
    virtual void error(const std::string& message);
    virtual void critical(const std::string& message);

    virtual void flush() = 0;

protected:
    std::atomic<LogLevel> currentLevel_{LogLevel::LOG_INFO};
    virtual void log(LogLevel, const std::string&) = 0;
    virtual bool shouldSkipLog(LogLevel level) const;

    /// Строка вида "<время> [<уровень>] <сообщение>" без перевода строки
    static std::string formatLine(LogLevel level, const std::string& message);
};

std::string leveltoString(LogLevel level);

/**
 * @brief Преобразовать имя уровня ("debug", "INFO", ...) в LogLevel
 * @throw std::invalid_argument Для неизвестного имени
 */
LogLevel stringToLogLevel(const std::string& name);

}  // namespace procguard
