/**
 * @file PidFile.cpp
 * @brief Реализация PidFile
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/PidFile.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "procguard/Errors.hpp"
#include "procguard/MarkerFile.hpp"

namespace procguard {

namespace {

constexpr mode_t kPidFileMode = 0644;

pid_t resolvePid(pid_t pid) {
    if (pid < 0) {
        throw std::invalid_argument("Invalid PID " + std::to_string(pid));
    }
    return pid > 0 ? pid : ::getpid();
}

}  // namespace

const char* toString(PidFileState state) noexcept {
    switch (state) {
        case PidFileState::Absent:
            return "absent";
        case PidFileState::ValidOwnedByUs:
            return "owned by this process";
        case PidFileState::ValidOwnedByOther:
            return "owned by another process";
        case PidFileState::Stale:
            return "stale";
    }
    return "unknown";
}

PidFile::PidFile(const std::string& filename, EventSink sink,
                 std::shared_ptr<IProcessProbe> probe,
                 std::string ownerDescription)
    : sink_(std::move(sink)),
      probe_(probe ? std::move(probe) : defaultProcessProbe()),
      ownerDescription_(std::move(ownerDescription)) {
    if (filename.empty()) {
        throw std::invalid_argument("No filename given on initializing PidFile");
    }
    path_ = std::filesystem::absolute(filename).lexically_normal();
}

PidFile::~PidFile() {
    if (!autoRemove_ || !created_) return;
    try {
        remove();
    } catch (const std::exception& e) {
        emitEvent(sink_, {EventKind::ServiceFailed, path_.string(), ::getpid(), 0,
                          {}, std::string("auto-remove failed: ") + e.what()});
    }
}

void PidFile::checkDirectory(bool requireWrite) const {
    const std::filesystem::path dir = path_.parent_path();
    const std::string name = path_.string();

    struct stat st {};
    if (::stat(dir.c_str(), &st) != 0) {
        throw InvalidPidFileError(name,
                                  "directory " + dir.string() + " doesn't exist",
                                  std::error_code(errno, std::system_category()));
    }
    if (!S_ISDIR(st.st_mode)) {
        throw InvalidPidFileError(name, dir.string() + " is not a directory");
    }
    // Для чтения достаточно права поиска в каталоге
    if (requireWrite && ::access(dir.c_str(), W_OK | X_OK) != 0) {
        throw InvalidPidFileError(name,
                                  "no write access to directory " + dir.string(),
                                  std::error_code(errno, std::system_category()));
    }

    if (::lstat(path_.c_str(), &st) != 0) {
        if (errno != ENOENT || ::access(dir.c_str(), X_OK) != 0) {
            throw InvalidPidFileError(name,
                                      "no access to directory " + dir.string(),
                                      std::error_code(errno, std::system_category()));
        }
    } else if (!S_ISREG(st.st_mode)) {
        throw InvalidPidFileError(name, "not a regular file");
    }
}

PidFileStatus PidFile::check() const {
    checkDirectory(false);
    return inspect(nullptr);
}

PidFileStatus PidFile::inspect(std::string* judgedRaw) const {

    std::optional<MarkerSnapshot> marker;
    try {
        marker = readMarker(path_);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot read PID file " + path_.string(),
                           path_.string(), e.code());
    }

    PidFileStatus status;
    if (!marker) return status;
    if (judgedRaw) *judgedRaw = marker->raw;

    if (!marker->record.pid) {
        status.state = PidFileState::Stale;
        emitEvent(sink_, {EventKind::PidFileStale, path_.string(), ::getpid(), 0,
                          {}, "content is not a valid PID"});
        return status;
    }

    status.pid = *marker->record.pid;
    if (status.pid == ::getpid()) {
        status.state = PidFileState::ValidOwnedByUs;
    } else if (probe_->probe(status.pid) == Liveness::Dead) {
        status.state = PidFileState::Stale;
        emitEvent(sink_, {EventKind::PidFileStale, path_.string(), ::getpid(),
                          status.pid, {}, std::string()});
    } else {
        status.state = PidFileState::ValidOwnedByOther;
    }
    return status;
}

void PidFile::removeExisting() {
    try {
        removeMarker(path_);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot remove PID file " + path_.string(),
                           path_.string(), e.code());
    }
}

bool PidFile::takeOverExisting(const std::string& judgedRaw) {
    try {
        return takeOverMarker(path_, judgedRaw);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot remove stale PID file " + path_.string(),
                           path_.string(), e.code());
    }
}

void PidFile::create(bool force, pid_t pid) {
    const pid_t newPid = resolvePid(pid);
    checkDirectory(true);

    std::string judged;
    const PidFileStatus status = inspect(&judged);

    if (!force && status.state == PidFileState::ValidOwnedByOther) {
        throw PidFileInUseError(path_.string(), status.pid);
    }
    // Удаляется только тот файл, который был проверен. Если его успели
    // заменить, публикация ниже получит EEXIST.
    if (status.state != PidFileState::Absent) takeOverExisting(judged);

    bool published = false;
    try {
        published = publishMarker(path_, formatMarker(newPid), kPidFileMode);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot write PID file " + path_.string(),
                           path_.string(), e.code());
    }

    if (!published) {
        // Другой процесс создал файл между проверкой и записью
        const PidFileStatus raced = check();
        if (raced.state == PidFileState::ValidOwnedByOther) {
            throw PidFileInUseError(path_.string(), raced.pid);
        }
        throw PidFileError("PID file " + path_.string() +
                               " was created concurrently by another process",
                           path_.string(),
                           std::error_code(EEXIST, std::system_category()));
    }

    created_ = true;
    writtenPid_ = newPid;
    emitEvent(sink_, {EventKind::PidFileCreated, path_.string(), newPid, 0, {},
                      ownerDescription_});
}

void PidFile::recreate(pid_t pid) {
    if (!created_) {
        throw PidFileError("Cannot recreate PID file " + path_.string() +
                               ": it was not created by this process",
                           path_.string());
    }
    const pid_t newPid = resolvePid(pid);

    std::optional<MarkerSnapshot> current;
    try {
        current = readMarker(path_);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot read PID file " + path_.string(),
                           path_.string(), e.code());
    }

    if (current) {
        if (!current->record.pid) {
            throw InvalidPidFileError(path_.string(),
                                      "content is not a positive integer");
        }
        const pid_t recorded = *current->record.pid;
        if (recorded != writtenPid_ && recorded != newPid &&
            isAliveOrUnknown(probe_->probe(recorded))) {
            throw PidFileInUseError(path_.string(), recorded);
        }
    }

    try {
        replaceMarker(path_, formatMarker(newPid), kPidFileMode);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot rewrite PID file " + path_.string(),
                           path_.string(), e.code());
    }

    const pid_t oldPid = writtenPid_;
    writtenPid_ = newPid;
    emitEvent(sink_, {EventKind::PidFileCreated, path_.string(), newPid, oldPid,
                      {}, ownerDescription_ + " (recreated)"});
}

void PidFile::remove() {
    std::optional<MarkerSnapshot> current;
    try {
        current = readMarker(path_);
    } catch (const std::system_error& e) {
        throw PidFileError("Cannot read PID file " + path_.string(),
                           path_.string(), e.code());
    }

    if (!current) {
        created_ = false;
        return;
    }

    if (current->record.pid) {
        const pid_t recorded = *current->record.pid;
        if (recorded != ::getpid() && recorded != writtenPid_ &&
            isAliveOrUnknown(probe_->probe(recorded))) {
            throw PidFileError("Refusing to remove PID file " + path_.string() +
                                   " owned by running process " +
                                   std::to_string(recorded),
                               path_.string());
        }
    }

    removeExisting();
    created_ = false;
    emitEvent(sink_, {EventKind::PidFileRemoved, path_.string(), ::getpid(), 0,
                      {}, std::string()});
}

}  // namespace procguard
