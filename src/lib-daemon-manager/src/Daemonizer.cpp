/**
 * @file Daemonizer.cpp
 * @brief Реализация Daemonizer: двойной fork, перенаправление потоков, смена пользователя
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/Daemonizer.hpp"

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "procguard/Errors.hpp"

namespace procguard {

namespace {

std::error_code lastError() {
    return std::error_code(errno, std::system_category());
}

bool isNumeric(const std::string& text) {
    if (text.empty()) return false;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Числовой uid/gid; (id_t)-1 зарезервирован и тоже отвергается
template <typename Id>
Id parseNumericId(const std::string& text, const std::string& what) {
    errno = 0;
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno == ERANGE || end == text.c_str() || *end != '\0' ||
        value >= static_cast<unsigned long long>(std::numeric_limits<Id>::max())) {
        throw DaemonizeError(DaemonizeStage::Prepare,
                             "invalid " + what + " id " + text,
                             std::error_code(ERANGE, std::system_category()));
    }
    return static_cast<Id>(value);
}

std::vector<char> lookupBuffer(int name) {
    long size = ::sysconf(name);
    return std::vector<char>(size > 0 ? static_cast<std::size_t>(size) : 16384);
}

}  // namespace

const char* toString(DaemonPhase phase) noexcept {
    switch (phase) {
        case DaemonPhase::Foreground:
            return "foreground";
        case DaemonPhase::Forked:
            return "forked";
        case DaemonPhase::SessionLeader:
            return "session-leader";
        case DaemonPhase::Detached:
            return "detached";
    }
    return "unknown";
}

RedirectTarget RedirectTarget::parse(const std::string& text) {
    if (text.empty() || text == "discard" || text == "/dev/null") {
        return discard();
    }
    if (text == "inherit") return inherit();
    return file(text);
}

Daemonizer::Daemonizer(DaemonSettings settings, EventSink sink,
                       std::shared_ptr<ISystemCalls> sys)
    : settings_(std::move(settings)),
      sink_(std::move(sink)),
      sys_(sys ? std::move(sys) : defaultSystemCalls()) {}

Daemonizer::Credentials Daemonizer::resolveCredentials() const {
    Credentials credentials;

    if (!settings_.user.empty()) {
        struct passwd pwd {};
        struct passwd* found = nullptr;
        std::vector<char> buffer = lookupBuffer(_SC_GETPW_R_SIZE_MAX);
        int rc = isNumeric(settings_.user)
                     ? ::getpwuid_r(parseNumericId<uid_t>(settings_.user, "user"),
                                    &pwd, buffer.data(), buffer.size(), &found)
                     : ::getpwnam_r(settings_.user.c_str(), &pwd, buffer.data(),
                                    buffer.size(), &found);
        if (rc != 0 || found == nullptr) {
            throw DaemonizeError(DaemonizeStage::Prepare,
                                 "unknown user " + settings_.user,
                                 rc != 0 ? std::error_code(rc, std::system_category())
                                         : std::error_code());
        }
        credentials.user = pwd.pw_name;
        credentials.uid = pwd.pw_uid;
        credentials.gid = pwd.pw_gid;
        credentials.switch_user = true;
        credentials.switch_group = true;
    }

    if (!settings_.group.empty()) {
        struct group grp {};
        struct group* found = nullptr;
        std::vector<char> buffer = lookupBuffer(_SC_GETGR_R_SIZE_MAX);
        int rc = isNumeric(settings_.group)
                     ? ::getgrgid_r(parseNumericId<gid_t>(settings_.group, "group"),
                                    &grp, buffer.data(), buffer.size(), &found)
                     : ::getgrnam_r(settings_.group.c_str(), &grp, buffer.data(),
                                    buffer.size(), &found);
        if (rc != 0 || found == nullptr) {
            throw DaemonizeError(DaemonizeStage::Prepare,
                                 "unknown group " + settings_.group,
                                 rc != 0 ? std::error_code(rc, std::system_category())
                                         : std::error_code());
        }
        credentials.gid = grp.gr_gid;
        credentials.switch_group = true;
    }

    return credentials;
}

int Daemonizer::openTarget(const RedirectTarget& target, int nullFd) {
    switch (target.kind) {
        case RedirectKind::Discard:
            return nullFd;
        case RedirectKind::Inherit:
            return -1;
        case RedirectKind::File: {
            int fd = sys_->open(target.path.c_str(),
                                O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
            if (fd < 0) {
                throw DaemonizeError(DaemonizeStage::Prepare,
                                     "cannot open " + target.path, lastError(),
                                     target.path);
            }
            return fd;
        }
    }
    return nullFd;
}

Daemonizer::Streams Daemonizer::openStreams() {
    Streams streams;
    streams.null_fd = sys_->open("/dev/null", O_RDWR | O_CLOEXEC, 0);
    if (streams.null_fd < 0) {
        throw DaemonizeError(DaemonizeStage::Prepare, "cannot open /dev/null",
                             lastError(), "/dev/null");
    }

    try {
        streams.stdout_fd = openTarget(settings_.stdout_target, streams.null_fd);
        streams.stderr_fd = openTarget(settings_.stderr_target, streams.null_fd);
    } catch (const DaemonizeError&) {
        closeStreams(streams);
        throw;
    }
    return streams;
}

void Daemonizer::closeStreams(Streams& streams) {
    for (int* fd : {&streams.stdout_fd, &streams.stderr_fd}) {
        if (*fd > STDERR_FILENO && *fd != streams.null_fd) sys_->close(*fd);
        *fd = -1;
    }
    if (streams.null_fd > STDERR_FILENO) sys_->close(streams.null_fd);
    streams.null_fd = -1;
}

void Daemonizer::redirect(Streams& streams) {
    const int targets[] = {streams.null_fd, streams.stdout_fd, streams.stderr_fd};
    for (int stdFd = STDIN_FILENO; stdFd <= STDERR_FILENO; ++stdFd) {
        int source = targets[stdFd];
        if (source < 0 || source == stdFd) continue;
        if (sys_->dup2(source, stdFd) < 0) {
            throw DaemonizeError(DaemonizeStage::Redirect,
                                 "dup2 to descriptor " + std::to_string(stdFd),
                                 lastError());
        }
    }
    closeStreams(streams);
}

void Daemonizer::switchUser(const Credentials& credentials) {
    if (credentials.switch_group && sys_->setgid(credentials.gid) != 0) {
        throw DaemonizeError(DaemonizeStage::SwitchUser,
                             "setgid(" + std::to_string(credentials.gid) + ")",
                             lastError());
    }
    if (!credentials.switch_user) return;

    if (sys_->initgroups(credentials.user.c_str(), credentials.gid) != 0) {
        throw DaemonizeError(DaemonizeStage::SwitchUser,
                             "initgroups(" + credentials.user + ")", lastError());
    }
    if (sys_->setuid(credentials.uid) != 0) {
        throw DaemonizeError(DaemonizeStage::SwitchUser,
                             "setuid(" + std::to_string(credentials.uid) + ")",
                             lastError());
    }
}

void Daemonizer::exitParent() {
    sys_->exitProcess(EXIT_SUCCESS);
    throw std::logic_error("Daemonizer: exitProcess() returned in parent");
}

DetachResult Daemonizer::daemonize() {
    if (used_) {
        throw std::logic_error("Daemonizer: daemonize() may be called only once");
    }
    used_ = true;

    DetachResult result;
    result.original_pid = sys_->getpid();

    const Credentials credentials = resolveCredentials();
    Streams streams = openStreams();

    // Буферы вывода иначе попадут в вывод и родителя, и потомка
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    // 1. Первый fork: единственный сбой, о котором узнаёт терминал
    pid_t pid = sys_->fork();
    if (pid < 0) {
        std::error_code code = lastError();
        closeStreams(streams);
        throw DaemonizeError(DaemonizeStage::Fork, "first fork failed", code);
    }
    if (pid > 0) exitParent();
    phase_ = DaemonPhase::Forked;

    // 2. Новая сессия без управляющего терминала
    if (sys_->setsid() < 0) {
        std::error_code code = lastError();
        closeStreams(streams);
        throw DaemonizeError(DaemonizeStage::Session, "setsid failed", code);
    }
    phase_ = DaemonPhase::SessionLeader;

    // 3. Второй fork: лидер сессии завершается
    pid = sys_->fork();
    if (pid < 0) {
        std::error_code code = lastError();
        closeStreams(streams);
        throw DaemonizeError(DaemonizeStage::SecondFork, "second fork failed",
                             code);
    }
    if (pid > 0) exitParent();

    if (sys_->chdir(settings_.workdir.c_str()) != 0) {
        std::error_code code = lastError();
        closeStreams(streams);
        throw DaemonizeError(DaemonizeStage::Chdir,
                             "chdir to " + settings_.workdir.string(), code,
                             settings_.workdir.string());
    }
    sys_->umask(settings_.umask);

    redirect(streams);
    if (settings_.close_fds) sys_->closeFrom(STDERR_FILENO + 1);

    switchUser(credentials);

    phase_ = DaemonPhase::Detached;
    result.daemon_pid = sys_->getpid();
    emitEvent(sink_, {EventKind::DaemonDetached, settings_.workdir.string(),
                      result.daemon_pid, result.original_pid, {}, std::string()});
    return result;
}

}  // namespace procguard
