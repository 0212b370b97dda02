/**
 * @file SystemCalls.hpp
 * @brief Системные вызовы, используемые при демонизации
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Интерфейс позволяет проверить конечный автомат демонизации
 * без реальных fork() и setsid() (см. MockSystemCalls в тестах).
 */
#pragma once

#include <sys/types.h>

#include <memory>

namespace procguard {

class ISystemCalls {
public:
    virtual ~ISystemCalls() = default;

    virtual pid_t fork() = 0;
    virtual pid_t setsid() = 0;
    virtual pid_t getpid() = 0;
    virtual int chdir(const char* path) = 0;
    virtual mode_t umask(mode_t mask) = 0;
    virtual int open(const char* path, int flags, mode_t mode) = 0;
    virtual int dup2(int oldfd, int newfd) = 0;
    virtual int close(int fd) = 0;
    /// Закрыть все дескрипторы начиная с lowest
    virtual void closeFrom(int lowest) = 0;
    virtual int setgid(gid_t gid) = 0;
    virtual int initgroups(const char* user, gid_t group) = 0;
    virtual int setuid(uid_t uid) = 0;
    /// Немедленно завершить процесс без раскрутки стека (_exit)
    virtual void exitProcess(int status) = 0;
};

class PosixSystemCalls : public ISystemCalls {
public:
    pid_t fork() override;
    pid_t setsid() override;
    pid_t getpid() override;
    int chdir(const char* path) override;
    mode_t umask(mode_t mask) override;
    int open(const char* path, int flags, mode_t mode) override;
    int dup2(int oldfd, int newfd) override;
    int close(int fd) override;
    void closeFrom(int lowest) override;
    int setgid(gid_t gid) override;
    int initgroups(const char* user, gid_t group) override;
    int setuid(uid_t uid) override;
    void exitProcess(int status) override;
};

std::shared_ptr<ISystemCalls> defaultSystemCalls();

}  // namespace procguard
