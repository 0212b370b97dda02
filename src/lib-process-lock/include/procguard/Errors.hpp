/**
 * @file Errors.hpp
 * @brief Иерархия исключений procguard
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Каждое исключение несёт путь к проблемному файлу и, где это
 * применимо, код системной ошибки. По типу исключения вызывающий код
 * выбирает код завершения процесса.
 */
#pragma once

#include <sys/types.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>

namespace procguard {

/**
 * @class ProcessGuardError
 * @brief Базовый класс всех ошибок procguard
 */
class ProcessGuardError : public std::runtime_error {
public:
    ProcessGuardError(const std::string& message, std::string path,
                      std::error_code code = std::error_code());

    const std::string& path() const noexcept { return path_; }
    const std::error_code& code() const noexcept { return code_; }

private:
    std::string path_;
    std::error_code code_;
};

class LockError : public ProcessGuardError {
public:
    using ProcessGuardError::ProcessGuardError;
};

/// Блокировку не удалось получить до истечения общего таймаута
class LockTimeout : public LockError {
public:
    LockTimeout(const std::string& path, std::chrono::duration<double> waited,
                pid_t holder);

    std::chrono::duration<double> waited() const noexcept { return waited_; }
    /// pid владельца маркера на момент отказа (0, если не разобран)
    pid_t holder() const noexcept { return holder_; }

private:
    std::chrono::duration<double> waited_;
    pid_t holder_;
};

/// Ошибка файловой системы, отличная от EEXIST. Не повторяется.
class LockIOError : public LockError {
public:
    using LockError::LockError;
};

/// Маркер на диске больше не принадлежит держателю дескриптора
class LockOwnershipError : public LockError {
public:
    LockOwnershipError(const std::string& path, pid_t expected, pid_t found);

    pid_t expected() const noexcept { return expected_; }
    pid_t found() const noexcept { return found_; }

private:
    pid_t expected_;
    pid_t found_;
};

/// Общая ошибка ввода-вывода PID-файла
class PidFileError : public ProcessGuardError {
public:
    using ProcessGuardError::ProcessGuardError;
};

/// PID-файл принадлежит другому живому процессу
class PidFileInUseError : public PidFileError {
public:
    PidFileInUseError(const std::string& path, pid_t pid);

    pid_t pid() const noexcept { return pid_; }

private:
    pid_t pid_;
};

/// PID-файл или его каталог непригодны для использования
class InvalidPidFileError : public PidFileError {
public:
    InvalidPidFileError(const std::string& path, std::string reason,
                        std::error_code code = std::error_code());

    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

/**
 * @enum DaemonizeStage
 * @brief Шаг демонизации, на котором произошёл сбой
 */
enum class DaemonizeStage {
    Prepare,     ///< Подготовка до первого fork (файлы, пользователь)
    Fork,        ///< Первый fork
    Session,     ///< setsid
    SecondFork,  ///< Второй fork
    Chdir,       ///< Смена рабочего каталога
    Redirect,    ///< Перенаправление стандартных потоков
    SwitchUser   ///< Смена группы и пользователя
};

const char* toString(DaemonizeStage stage) noexcept;

class DaemonizeError : public ProcessGuardError {
public:
    DaemonizeError(DaemonizeStage stage, const std::string& message,
                   std::error_code code = std::error_code(),
                   std::string path = std::string());

    DaemonizeStage stage() const noexcept { return stage_; }

private:
    DaemonizeStage stage_;
};

}  // namespace procguard
