/**
 * @file exitcodes.hpp
 * @brief Коды завершения procguardd
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include <exception>

namespace procguard {

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_FORK_FAILED = 1,
    EXIT_ALREADY_RUNNING = 2,
    EXIT_PIDFILE_ERROR = 3,
    EXIT_SETSID_FAILED = 4,
    EXIT_OTHER_FAILURE = 5,
    EXIT_DAEMONIZE_FAILED = 6,
    EXIT_LOCK_TIMEOUT = 7,
    EXIT_LOCK_ERROR = 8,
    EXIT_USAGE = 64
};

/**
 * @brief Код завершения для исключения
 *
 * PidFileInUseError -> 2, прочие ошибки PID-файла -> 3, DaemonizeError по
 * стадии (Fork -> 1, Session -> 4, остальные -> 6), LockTimeout -> 7,
 * прочие ошибки блокировки -> 8, всё остальное -> 5.
 */
int exitCodeFor(const std::exception_ptr& error) noexcept;

}  // namespace procguard
