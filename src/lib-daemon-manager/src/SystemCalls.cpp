/**
 * @file SystemCalls.cpp
 * @brief POSIX-реализация ISystemCalls
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/SystemCalls.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <grp.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <vector>

namespace procguard {

pid_t PosixSystemCalls::fork() { return ::fork(); }

pid_t PosixSystemCalls::setsid() { return ::setsid(); }

pid_t PosixSystemCalls::getpid() { return ::getpid(); }

int PosixSystemCalls::chdir(const char* path) { return ::chdir(path); }

mode_t PosixSystemCalls::umask(mode_t mask) { return ::umask(mask); }

int PosixSystemCalls::open(const char* path, int flags, mode_t mode) {
    return ::open(path, flags, mode);
}

int PosixSystemCalls::dup2(int oldfd, int newfd) {
    int rc;
    do {
        rc = ::dup2(oldfd, newfd);
    } while (rc == -1 && errno == EINTR);
    return rc;
}

int PosixSystemCalls::close(int fd) { return ::close(fd); }

namespace {

// Открытые дескрипторы >= lowest по /proc/self/fd; false без procfs
bool listOpenFds(int lowest, std::vector<int>& fds) {
    DIR* dir = ::opendir("/proc/self/fd");
    if (dir == nullptr) return false;
    const int own = ::dirfd(dir);
    while (const struct dirent* entry = ::readdir(dir)) {
        char* end = nullptr;
        const long fd = std::strtol(entry->d_name, &end, 10);
        if (end == entry->d_name || *end != '\0') continue;
        if (fd >= lowest && fd != own) fds.push_back(static_cast<int>(fd));
    }
    ::closedir(dir);
    return true;
}

}  // namespace

void PosixSystemCalls::closeFrom(int lowest) {
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, static_cast<unsigned>(lowest), ~0U, 0U) == 0) {
        return;
    }
#endif
    // Ядро без close_range: закрываем только реально открытые номера
    std::vector<int> fds;
    if (listOpenFds(lowest, fds)) {
        for (int fd : fds) ::close(fd);
        return;
    }

    long maxFd = ::sysconf(_SC_OPEN_MAX);
    if (maxFd < 0) maxFd = 1024;
    for (long fd = lowest; fd < maxFd; ++fd) {
        // EBADF для незанятых номеров ожидаем
        ::close(static_cast<int>(fd));
    }
}

int PosixSystemCalls::setgid(gid_t gid) { return ::setgid(gid); }

int PosixSystemCalls::initgroups(const char* user, gid_t group) {
    return ::initgroups(user, group);
}

int PosixSystemCalls::setuid(uid_t uid) { return ::setuid(uid); }

void PosixSystemCalls::exitProcess(int status) { ::_exit(status); }

std::shared_ptr<ISystemCalls> defaultSystemCalls() {
    static std::shared_ptr<ISystemCalls> calls =
        std::make_shared<PosixSystemCalls>();
    return calls;
}

}  // namespace procguard
