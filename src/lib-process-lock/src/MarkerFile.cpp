/**
 * @file MarkerFile.cpp
 * @brief Разбор и атомарная запись маркеров
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/MarkerFile.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

namespace procguard {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.begin();
    auto end = text.end();
    while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
        ++begin;
    }
    while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(begin, end);
}

[[noreturn]] void throwErrno(const std::string& what,
                             const std::filesystem::path& path) {
    throw std::system_error(errno, std::system_category(),
                            what + " " + path.string());
}

// Закрывает дескриптор при выходе из области видимости
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

    int get() const { return fd_; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

void writeAll(int fd, const std::string& content,
              const std::filesystem::path& path) {
    const char* data = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        ssize_t written = ::write(fd, data, left);
        if (written < 0) {
            if (errno == EINTR) continue;
            throwErrno("write failed for", path);
        }
        data += written;
        left -= static_cast<std::size_t>(written);
    }
}

// Записывает содержимое в уже открытый файл, fsync и close
void writeAndSync(FdGuard& fd, const std::string& content, mode_t mode,
                  const std::filesystem::path& path) {
    // права не должны зависеть от umask процесса
    if (::fchmod(fd.get(), mode) != 0) throwErrno("fchmod failed for", path);
    writeAll(fd.get(), content, path);
    if (::fsync(fd.get()) != 0) throwErrno("fsync failed for", path);
    if (::close(fd.release()) != 0) throwErrno("close failed for", path);
}

std::filesystem::path makeTempPath(const std::filesystem::path& path) {
    static std::atomic<unsigned> counter{0};
    std::string name = "." + path.filename().string() + ".tmp." +
                       std::to_string(::getpid()) + "." +
                       std::to_string(counter.fetch_add(1));
    return path.parent_path() / name;
}

// Создаёт временный файл рядом с path и пишет в него content
std::filesystem::path writeTemp(const std::filesystem::path& path,
                                const std::string& content, mode_t mode) {
    std::filesystem::path temp = makeTempPath(path);
    FdGuard fd(::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                      mode));
    if (fd.get() < 0) throwErrno("cannot create", temp);

    try {
        writeAndSync(fd, content, mode, temp);
    } catch (const std::system_error&) {
        ::unlink(temp.c_str());
        throw;
    }
    return temp;
}

}  // namespace

std::optional<pid_t> parsePid(const std::string& text) {
    std::string value = trim(text);
    if (value.empty() || value.size() > 10) return std::nullopt;

    long long pid = 0;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        pid = pid * 10 + (c - '0');
    }
    if (pid <= 0 || pid > std::numeric_limits<pid_t>::max()) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

std::string formatTimestamp(Clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                      tp.time_since_epoch())
                      .count();
    std::ostringstream oss;
    oss << micros / 1000000 << '.' << std::setw(6) << std::setfill('0')
        << micros % 1000000;
    return oss.str();
}

std::optional<Clock::time_point> parseTimestamp(const std::string& text) {
    std::string value = trim(text);
    auto dot = value.find('.');
    if (dot == std::string::npos || dot == 0 || value.size() - dot - 1 != 6) {
        return std::nullopt;
    }

    long long seconds = 0;
    long long micros = 0;
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (i == dot) continue;
        char c = value[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        if (i < dot) {
            if (seconds > std::numeric_limits<long long>::max() / 100) {
                return std::nullopt;
            }
            seconds = seconds * 10 + (c - '0');
        } else {
            micros = micros * 10 + (c - '0');
        }
    }
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(
        std::chrono::seconds(seconds) + std::chrono::microseconds(micros)));
}

std::string formatMarker(pid_t pid,
                         const std::optional<Clock::time_point>& created_at) {
    std::string content = std::to_string(pid) + "\n";
    if (created_at) {
        content += formatTimestamp(*created_at) + "\n";
    }
    return content;
}

MarkerRecord parseMarker(const std::string& text) {
    MarkerRecord record;
    std::istringstream stream(text);
    std::string line;

    if (std::getline(stream, line)) {
        record.pid = parsePid(line);
    }
    if (std::getline(stream, line)) {
        record.created_at = parseTimestamp(line);
    }
    return record;
}

std::optional<MarkerSnapshot> readMarker(const std::filesystem::path& path) {
    FdGuard fd(::open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW));
    if (fd.get() < 0) {
        if (errno == ENOENT) return std::nullopt;
        throwErrno("cannot open", path);
    }

    struct stat st {};
    if (::fstat(fd.get(), &st) != 0) throwErrno("fstat failed for", path);

    MarkerSnapshot snapshot;
    // маркер короткий; больше 4 КиБ читать незачем
    char buffer[4096];
    while (snapshot.raw.size() < sizeof(buffer)) {
        ssize_t got = ::read(fd.get(), buffer, sizeof(buffer));
        if (got < 0) {
            if (errno == EINTR) continue;
            throwErrno("read failed for", path);
        }
        if (got == 0) break;
        snapshot.raw.append(buffer, static_cast<std::size_t>(got));
    }

    snapshot.record = parseMarker(snapshot.raw);
    snapshot.modified_at =
        Clock::time_point(std::chrono::duration_cast<Clock::duration>(
            std::chrono::seconds(st.st_mtim.tv_sec) +
            std::chrono::nanoseconds(st.st_mtim.tv_nsec)));
    return snapshot;
}

bool publishMarker(const std::filesystem::path& path,
                   const std::string& content, mode_t mode) {
    std::filesystem::path temp = writeTemp(path, content, mode);

    if (::link(temp.c_str(), path.c_str()) == 0) {
        ::unlink(temp.c_str());
        return true;
    }

    int linkErrno = errno;
    ::unlink(temp.c_str());
    if (linkErrno == EEXIST) return false;

    if (linkErrno != EPERM && linkErrno != EOPNOTSUPP) {
        errno = linkErrno;
        throwErrno("cannot publish", path);
    }

    // Файловая система без жёстких ссылок: эксклюзивное создание напрямую
    FdGuard fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                      mode));
    if (fd.get() < 0) {
        if (errno == EEXIST) return false;
        throwErrno("cannot create", path);
    }
    try {
        writeAndSync(fd, content, mode, path);
    } catch (const std::system_error&) {
        ::unlink(path.c_str());
        throw;
    }
    return true;
}

void replaceMarker(const std::filesystem::path& path,
                   const std::string& content, mode_t mode) {
    std::filesystem::path temp = writeTemp(path, content, mode);
    if (::rename(temp.c_str(), path.c_str()) != 0) {
        int renameErrno = errno;
        ::unlink(temp.c_str());
        errno = renameErrno;
        throwErrno("cannot replace", path);
    }
}

bool removeMarker(const std::filesystem::path& path) {
    if (::unlink(path.c_str()) == 0) return true;
    if (errno == ENOENT) return false;
    throwErrno("cannot remove", path);
}

bool takeOverMarker(const std::filesystem::path& path,
                    const std::string& judgedRaw) {
    std::filesystem::path aside = path;
    aside += ".stale." + std::to_string(::getpid());

    if (::rename(path.c_str(), aside.c_str()) != 0) {
        if (errno == ENOENT) return false;
        throwErrno("cannot move aside", path);
    }

    std::optional<MarkerSnapshot> moved = readMarker(aside);
    if (moved && moved->raw == judgedRaw) {
        removeMarker(aside);
        return true;
    }

    // Между проверкой и переименованием появился новый маркер: вернуть его
    if (moved && ::link(aside.c_str(), path.c_str()) != 0 && errno != EEXIST) {
        int linkErrno = errno;
        ::unlink(aside.c_str());
        errno = linkErrno;
        throwErrno("cannot restore", path);
    }
    removeMarker(aside);
    return false;
}

}  // namespace procguard
