/**
 * @file filelogger.hpp
 * @brief Синхронный файловый логгер с резервным файлом
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include "procguard/ilogger.hpp"

#include <fstream>
#include <mutex>
#include <string>

namespace procguard {

/**
 * @class FileLogger
 * @brief Синхронный логгер в файл с резервным файлом
 *
 * @details Если основной файл не удаётся открыть, записи идут в резервный.
 * После демонизации дескрипторы закрываются, поэтому демон вызывает
 * reopen() в конечном процессе.
 */
class FileLogger : public ILogger {
public:
    explicit FileLogger(std::string mainLogPath,
                        std::string fallbackLogPath = std::string());
    ~FileLogger() override;

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void init(const LogLevel level) override;
    void flush() override;

    /// Закрыть и заново открыть файлы журнала
    void reopen();

    void setMainLogPath(const std::string& path);
    void setFallbackLogPath(const std::string& path);
    std::string getMainLogPath() const;
    std::string getFallbackLogPath() const;

    /// true, если записи сейчас идут в основной файл
    bool isMainOpen() const;

protected:
    void log(LogLevel level, const std::string& message) override;

private:
    void reopenLocked();

    mutable std::mutex mutex_;
    std::ofstream mainLogFile_;
    std::ofstream fallbackLogFile_;
    std::string mainLogPath_;
    std::string fallbackLogPath_;
};

}  // namespace procguard
