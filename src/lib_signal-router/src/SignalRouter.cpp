/**
 * @file SignalRouter.cpp
 * @brief Реализация SignalRouter на signalfd и epoll
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/SignalRouter.hpp"

#include <sys/epoll.h>

#include <cerrno>
#include <stdexcept>

namespace procguard {

namespace {

void validateSignal(int signum) {
    if (signum <= 0 || signum >= NSIG || signum == SIGKILL || signum == SIGSTOP) {
        throw std::invalid_argument("Invalid signal number " +
                                    std::to_string(signum));
    }
}

}  // namespace

SignalRouter::SignalRouter() {
    sigemptyset(&blocked_mask_);
    if (pthread_sigmask(SIG_SETMASK, nullptr, &original_mask_) != 0) {
        throw std::system_error(errno, std::system_category(),
                                "sigprocmask(GET) failed");
    }
    if ((signal_fd_ = signalfd(-1, &blocked_mask_, SFD_NONBLOCK | SFD_CLOEXEC)) ==
        -1) {
        throw std::system_error(errno, std::system_category(),
                                "signalfd create failed");
    }
}

void SignalRouter::registerHandler(int signum, Handler handler) {
    validateSignal(signum);

    std::lock_guard<std::mutex> lock(handlers_mutex_);

    sigaddset(&blocked_mask_, signum);
    int rc = pthread_sigmask(SIG_BLOCK, &blocked_mask_, nullptr);
    if (rc != 0) {
        throw std::system_error(rc, std::system_category(),
                                "pthread_sigmask(BLOCK) failed");
    }

    // Обновляем signalfd
    if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
        throw std::system_error(errno, std::system_category(),
                                "signalfd configure failed");
    }

    handlers_[signum].push_back(std::move(handler));
}

void SignalRouter::unregisterHandler(int signum) {
    validateSignal(signum);

    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_.erase(signum);
    if (!sigismember(&blocked_mask_, signum)) return;

    sigdelset(&blocked_mask_, signum);
    if (signalfd(signal_fd_, &blocked_mask_, 0) == -1) {
        throw std::system_error(errno, std::system_category(),
                                "signalfd configure failed");
    }

    if (!sigismember(&original_mask_, signum)) {
        sigset_t single_mask;
        sigemptyset(&single_mask);
        sigaddset(&single_mask, signum);
        pthread_sigmask(SIG_UNBLOCK, &single_mask, nullptr);
    }
}

void SignalRouter::start() {
    if (running_.exchange(true)) return;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ == -1) {
        running_ = false;
        throw std::system_error(errno, std::system_category(),
                                "epoll_create1 failed");
    }

    struct epoll_event ev {};
    ev.events = EPOLLIN;
    ev.data.fd = signal_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, signal_fd_, &ev) == -1) {
        int err = errno;
        close(epoll_fd_);
        epoll_fd_ = -1;
        running_ = false;
        throw std::system_error(err, std::system_category(), "epoll_ctl failed");
    }

    worker_thread_ = std::thread([this] { processSignals(); });
}

void SignalRouter::processSignals() {
    constexpr int MAX_EVENTS = 10;
    struct epoll_event events[MAX_EVENTS];

    while (running_) {
        int nfds = epoll_wait(epoll_fd_, events, MAX_EVENTS, 200);
        if (nfds == -1) {
            if (errno == EINTR) continue;
            break;
        }

        for (int i = 0; i < nfds; ++i) {
            if (events[i].data.fd != signal_fd_) continue;

            struct signalfd_siginfo fdsi;
            while (read(signal_fd_, &fdsi, sizeof(fdsi)) == sizeof(fdsi)) {
                dispatch(static_cast<int>(fdsi.ssi_signo));
            }
        }
    }
}

void SignalRouter::dispatch(int signum) {
    std::vector<Handler> handlers;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(signum);
        if (it == handlers_.end()) return;
        handlers = it->second;
    }
    for (auto& handler : handlers) {
        handler(signum);
    }
}

void SignalRouter::stop() noexcept {
    running_ = false;
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (epoll_fd_ != -1) {
        close(epoll_fd_);
        epoll_fd_ = -1;
    }
}

SignalRouter::~SignalRouter() {
    stop();
    close(signal_fd_);
    pthread_sigmask(SIG_SETMASK, &original_mask_, nullptr);
}

std::string signalName(int signum) {
    switch (signum) {
        case SIGHUP:
            return "HUP";
        case SIGINT:
            return "INT";
        case SIGQUIT:
            return "QUIT";
        case SIGABRT:
            return "ABRT";
        case SIGKILL:
            return "KILL";
        case SIGUSR1:
            return "USR1";
        case SIGUSR2:
            return "USR2";
        case SIGPIPE:
            return "PIPE";
        case SIGALRM:
            return "ALRM";
        case SIGTERM:
            return "TERM";
        case SIGCHLD:
            return "CHLD";
        default:
            return "SIG" + std::to_string(signum);
    }
}

}  // namespace procguard
