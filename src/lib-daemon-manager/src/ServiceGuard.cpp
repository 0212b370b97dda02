/**
 * @file ServiceGuard.cpp
 * @brief Реализация ServiceGuard
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/ServiceGuard.hpp"

#include <csignal>
#include <stdexcept>
#include <utility>

#include "procguard/Errors.hpp"

namespace procguard {

ServiceGuard::ServiceGuard(GuardSettings settings, EventSink sink,
                           std::shared_ptr<IProcessProbe> probe,
                           std::shared_ptr<ISystemCalls> sys)
    : settings_(std::move(settings)),
      sink_(std::move(sink)),
      sys_(sys ? std::move(sys) : defaultSystemCalls()),
      pidfile_(settings_.pidfile, sink_, probe),
      lockFile_(settings_.lock_dir, sink_, probe),
      daemonizer_(settings_.daemon, sink_, sys_) {
    pidfile_.setAutoRemove(settings_.pidfile_auto_remove);
    settings_.retry.validate();
}

ServiceGuard::~ServiceGuard() { stop(); }

RunningService ServiceGuard::start(bool foreground_allowed) {
    if (started_) {
        throw std::logic_error("ServiceGuard: start() may be called only once");
    }
    if (!settings_.daemonize && !foreground_allowed) {
        throw std::invalid_argument(
            "ServiceGuard: daemonizing is disabled and running in foreground "
            "is not allowed");
    }
    started_ = true;

    RunningService service;
    service.original_pid = sys_->getpid();
    service.pid = service.original_pid;

    // Занятость PID-файла сообщается синхронно, ещё до отсоединения
    pidfile_.create();

    try {
        if (settings_.daemonize) {
            DetachResult detached = daemonizer_.daemonize();
            service.pid = detached.daemon_pid;
            service.daemonized = true;
            pidfile_.recreate(detached.daemon_pid);
        }
        acquireLocks();
        if (settings_.handle_signals) installSignalHandlers();
    } catch (const std::exception&) {
        cleanupAfterFailedStart();
        throw;
    }

    running_ = true;
    return service;
}

void ServiceGuard::acquireLocks() {
    for (const auto& lock : settings_.locks) {
        handles_.push_back(lockFile_.acquire(lock.resource_id, lock.path,
                                             settings_.retry,
                                             settings_.lock_timeout));
    }
}

void ServiceGuard::releaseLocks() {
    while (!handles_.empty()) {
        LockHandle& handle = handles_.back();
        try {
            lockFile_.release(handle);
        } catch (const LockError& e) {
            reportFailure(handle.path().string(), e.what());
        }
        handles_.pop_back();
    }
}

void ServiceGuard::cleanupAfterFailedStart() {
    router_.reset();
    releaseLocks();
    try {
        pidfile_.remove();
    } catch (const PidFileError& e) {
        reportFailure(pidfile_.path().string(), e.what());
    }
}

void ServiceGuard::installSignalHandlers() {
    router_ = std::make_unique<SignalRouter>();

    auto report = [this](int sig) {
        emitEvent(sink_, {EventKind::SignalReceived, std::string(), sys_->getpid(),
                          0, {}, signalName(sig)});
    };

    for (int sig : {SIGTERM, SIGINT, SIGABRT}) {
        router_->registerHandler(sig, [this, report](int signum) {
            report(signum);
            requestShutdown(signum);
        });
    }
    router_->registerHandler(SIGHUP, [this, report](int signum) {
        report(signum);
        requestRecheck();
    });
    router_->registerHandler(SIGUSR1, report);
    router_->registerHandler(SIGUSR2, report);

    router_->start();
}

void ServiceGuard::reportFailure(const std::string& path,
                                 const std::string& detail) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_ = true;
    }
    emitEvent(sink_, {EventKind::ServiceFailed, path, sys_->getpid(), 0, {},
                      detail});
}

bool ServiceGuard::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

void ServiceGuard::requestShutdown(int signum) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdownRequested_ = true;
        if (signum != 0) lastSignal_ = signum;
    }
    cv_.notify_all();
}

void ServiceGuard::requestRecheck() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        recheckRequested_ = true;
    }
    cv_.notify_all();
}

bool ServiceGuard::shutdownRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdownRequested_;
}

int ServiceGuard::waitForShutdown(
    std::chrono::duration<double> recheckInterval) {
    if (recheckInterval.count() <= 0) {
        throw std::invalid_argument("Recheck interval must be greater than zero");
    }
    const auto interval =
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            recheckInterval);

    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutdownRequested_) {
        cv_.wait_for(lock, interval,
                     [this] { return shutdownRequested_ || recheckRequested_; });
        if (shutdownRequested_) break;

        // По таймауту или по SIGHUP
        recheckRequested_ = false;
        lock.unlock();
        recheck();
        lock.lock();
    }
    return lastSignal_;
}

bool ServiceGuard::recheck() {
    if (!running_) return false;

    const std::string path = pidfile_.path().string();
    try {
        const PidFileStatus status = pidfile_.check();
        switch (status.state) {
            case PidFileState::ValidOwnedByUs:
                return true;
            case PidFileState::Absent:
            case PidFileState::Stale:
                pidfile_.create();
                emitEvent(sink_, {EventKind::PidFileRestored, path, sys_->getpid(),
                                  status.pid, {}, std::string()});
                return true;
            case PidFileState::ValidOwnedByOther:
                reportFailure(path, "PID file was taken over by process " +
                                        std::to_string(status.pid));
                requestShutdown();
                return false;
        }
    } catch (const PidFileError& e) {
        reportFailure(path, e.what());
        requestShutdown();
    }
    return false;
}

void ServiceGuard::stop() {
    if (!running_) return;
    running_ = false;

    emitEvent(sink_, {EventKind::ServiceStopping, pidfile_.path().string(),
                      sys_->getpid(), 0, {}, std::string()});

    router_.reset();
    releaseLocks();
    if (!settings_.pidfile_auto_remove) return;
    try {
        pidfile_.remove();
    } catch (const PidFileError& e) {
        reportFailure(pidfile_.path().string(), e.what());
    }
}

}  // namespace procguard
