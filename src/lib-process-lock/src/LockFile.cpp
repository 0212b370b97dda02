/**
 * @file LockFile.cpp
 * @brief Реализация LockFile: захват с повторами и перехват устаревших маркеров
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/LockFile.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "procguard/Errors.hpp"

namespace procguard {

namespace {

std::error_code lastError() {
    return std::error_code(errno, std::system_category());
}

// Время создания с точностью формата маркера
Clock::time_point markerNow() {
    return Clock::time_point(std::chrono::time_point_cast<std::chrono::microseconds>(
        Clock::now()));
}

}  // namespace

void RetryPolicy::validate() const {
    if (start_delay.count() <= 0) {
        throw std::invalid_argument("start_delay must be greater than zero");
    }
    if (delay_increase.count() < 0) {
        throw std::invalid_argument("delay_increase must not be negative");
    }
    if (max_delay.count() <= 0) {
        throw std::invalid_argument("max_delay must be greater than zero");
    }
    if (max_age && max_age->count() <= 0) {
        throw std::invalid_argument("max_age must be greater than zero");
    }
}

const char* toString(LockState state) noexcept {
    switch (state) {
        case LockState::Absent:
            return "absent";
        case LockState::Held:
            return "held";
        case LockState::Stale:
            return "stale";
    }
    return "unknown";
}

LockStatus classifyMarker(std::optional<MarkerSnapshot> marker,
                          const RetryPolicy& policy, const IProcessProbe& probe,
                          Clock::time_point now) {
    LockStatus status;
    if (!marker) return status;

    status.marker = std::move(marker);
    status.age = now - status.marker->effectiveCreatedAt();

    const auto& pid = status.marker->record.pid;
    if (policy.use_pid && pid) {
        status.probed = true;
        status.liveness = probe.probe(*pid);
        status.state = status.liveness == Liveness::Dead ? LockState::Stale
                                                         : LockState::Held;
        return status;
    }

    status.state = policy.max_age && status.age >= *policy.max_age
                       ? LockState::Stale
                       : LockState::Held;
    return status;
}

LockHandle::LockHandle(std::string resource_id, std::filesystem::path path,
                       pid_t holder_pid, Clock::time_point created_at)
    : resource_id_(std::move(resource_id)),
      path_(std::move(path)),
      holder_pid_(holder_pid),
      created_at_(created_at),
      valid_(true) {}

LockFile::LockFile(std::filesystem::path lockDir, EventSink sink,
                   std::shared_ptr<IProcessProbe> probe)
    : lockDir_(std::move(lockDir)),
      sink_(std::move(sink)),
      probe_(probe ? std::move(probe) : defaultProcessProbe()) {}

std::filesystem::path LockFile::resolve(
    const std::filesystem::path& lockPath) const {
    if (lockPath.empty()) {
        throw std::invalid_argument("Lock path must not be empty");
    }
    std::filesystem::path path =
        lockPath.is_absolute() ? lockPath : lockDir_ / lockPath;
    return std::filesystem::absolute(path).lexically_normal();
}

void LockFile::ensureLockDirectory(const std::filesystem::path& path) const {
    std::filesystem::path dir = path.parent_path();
    struct stat st {};
    if (::stat(dir.c_str(), &st) != 0) {
        throw LockIOError("Locking directory " + dir.string() + " doesn't exist",
                          dir.string(), lastError());
    }
    if (!S_ISDIR(st.st_mode)) {
        throw LockIOError("Locking path " + dir.string() + " is not a directory",
                          dir.string(),
                          std::error_code(ENOTDIR, std::system_category()));
    }
    if (::access(dir.c_str(), W_OK | X_OK) != 0) {
        throw LockIOError("Locking directory " + dir.string() + " isn't writeable",
                          dir.string(), lastError());
    }
}

LockHandle LockFile::acquire(const std::string& resourceId,
                             const std::filesystem::path& lockPath,
                             const RetryPolicy& policy,
                             std::chrono::duration<double> timeout, pid_t pid) {
    policy.validate();
    if (timeout.count() < 0) {
        throw std::invalid_argument("Lock timeout must not be negative");
    }
    if (pid < 0) {
        throw std::invalid_argument("Invalid PID " + std::to_string(pid));
    }

    const pid_t holder = pid > 0 ? pid : ::getpid();
    const std::filesystem::path path = resolve(lockPath);
    ensureLockDirectory(path);

    using Steady = std::chrono::steady_clock;
    const auto started = Steady::now();
    const auto deadline =
        started + std::chrono::duration_cast<Steady::duration>(timeout);

    RetryPolicy::Seconds delay = policy.start_delay;
    pid_t lastHolder = 0;
    bool firstAttempt = true;
    // Одна внеочередная попытка после удаления устаревшего или исчезнувшего
    // маркера; следующая возможна только после очередной паузы
    bool immediateRetry = false;
    bool immediateUsed = false;

    for (;;) {
        if (!firstAttempt && !immediateRetry && Steady::now() > deadline) break;
        firstAttempt = false;
        immediateRetry = false;

        const Clock::time_point createdAt = markerNow();
        bool published = false;
        try {
            published = publishMarker(path, formatMarker(holder, createdAt));
        } catch (const std::system_error& e) {
            throw LockIOError("Cannot create lock file " + path.string(),
                              path.string(), e.code());
        }

        if (published) {
            emitEvent(sink_, {EventKind::LockAcquired, path.string(), holder, 0,
                              Steady::now() - started, resourceId});
            return LockHandle(resourceId, path, holder, createdAt);
        }

        LockStatus status;
        try {
            status = classifyMarker(readMarker(path), policy, *probe_, Clock::now());
        } catch (const std::system_error& e) {
            throw LockIOError("Cannot read lock file " + path.string(),
                              path.string(), e.code());
        }

        if (status.state == LockState::Stale) {
            if (takeOver(path, *status.marker)) {
                std::string detail = status.probed
                                         ? std::string("owner is dead")
                                         : "older than " +
                                               std::to_string(static_cast<long long>(
                                                   status.age.count())) +
                                               " s";
                emitEvent(sink_, {EventKind::LockStaleTakeover, path.string(), holder,
                                  status.holder(), status.age, detail});
            }
        }

        // Маркер удалён (нами или владельцем): сразу ещё одна попытка
        if (status.state != LockState::Held && !immediateUsed) {
            immediateRetry = true;
            immediateUsed = true;
            continue;
        }

        if (status.state == LockState::Held) lastHolder = status.holder();

        const auto now = Steady::now();
        if (now >= deadline) break;

        const auto pause =
            std::min(std::chrono::duration_cast<Steady::duration>(delay),
                     deadline - now);
        std::this_thread::sleep_for(pause);
        delay = std::min(delay + policy.delay_increase, policy.max_delay);
        immediateUsed = false;
    }

    const std::chrono::duration<double> waited = Steady::now() - started;
    emitEvent(sink_, {EventKind::LockTimedOut, path.string(), holder, lastHolder,
                      waited, resourceId});
    throw LockTimeout(path.string(), waited, lastHolder);
}

bool LockFile::takeOver(const std::filesystem::path& path,
                        const MarkerSnapshot& judged) {
    try {
        return takeOverMarker(path, judged.raw);
    } catch (const std::system_error& e) {
        throw LockIOError("Cannot remove stale lock file " + path.string(),
                          path.string(), e.code());
    }
}

void LockFile::release(LockHandle& handle) {
    if (!handle.valid()) {
        throw std::logic_error("Release of an empty lock handle");
    }
    const std::string pathName = handle.path().string();

    std::optional<MarkerSnapshot> current;
    try {
        current = readMarker(handle.path());
    } catch (const std::system_error& e) {
        throw LockIOError("Cannot read lock file " + pathName, pathName, e.code());
    }

    const pid_t found = current && current->record.pid ? *current->record.pid : 0;
    const bool owned = current && found == handle.holderPid() &&
                       current->record.created_at &&
                       *current->record.created_at == handle.createdAt();
    if (!owned) {
        throw LockOwnershipError(pathName, handle.holderPid(), found);
    }

    try {
        removeMarker(handle.path());
    } catch (const std::system_error& e) {
        throw LockIOError("Cannot remove lock file " + pathName, pathName,
                          e.code());
    }

    handle.valid_ = false;
    emitEvent(sink_, {EventKind::LockReleased, pathName, handle.holderPid(), 0,
                      {}, handle.resourceId()});
}

LockStatus LockFile::check(const std::filesystem::path& lockPath,
                           const RetryPolicy& policy) const {
    policy.validate();
    const std::filesystem::path path = resolve(lockPath);
    try {
        return classifyMarker(readMarker(path), policy, *probe_, Clock::now());
    } catch (const std::system_error& e) {
        throw LockIOError("Cannot read lock file " + path.string(), path.string(),
                          e.code());
    }
}

}  // namespace procguard
