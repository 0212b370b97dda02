/**
 * @file Errors.cpp
 * @brief Сообщения исключений procguard
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/Errors.hpp"

#include <sstream>
#include <utility>

namespace procguard {

namespace {

std::string withCode(const std::string& message, const std::error_code& code) {
    if (!code) return message;
    return message + ": " + code.message();
}

}  // namespace

ProcessGuardError::ProcessGuardError(const std::string& message,
                                     std::string path, std::error_code code)
    : std::runtime_error(withCode(message, code)),
      path_(std::move(path)),
      code_(code) {}

LockTimeout::LockTimeout(const std::string& path,
                         std::chrono::duration<double> waited, pid_t holder)
    : LockError([&] {
                    std::ostringstream oss;
                    oss << "Timeout after " << waited.count()
                        << " s waiting for lock " << path;
                    if (holder > 0) oss << " held by PID " << holder;
                    return oss.str();
                }(),
                path),
      waited_(waited),
      holder_(holder) {}

LockOwnershipError::LockOwnershipError(const std::string& path, pid_t expected,
                                       pid_t found)
    : LockError("Lock " + path + " is no longer owned by PID " +
                    std::to_string(expected) + " (found PID " +
                    std::to_string(found) + ")",
                path),
      expected_(expected),
      found_(found) {}

PidFileInUseError::PidFileInUseError(const std::string& path, pid_t pid)
    : PidFileError("PID file " + path + " is in use by running process " +
                       std::to_string(pid),
                   path),
      pid_(pid) {}

InvalidPidFileError::InvalidPidFileError(const std::string& path,
                                         std::string reason,
                                         std::error_code code)
    : PidFileError("Invalid PID file " + path + ": " + reason, path, code),
      reason_(std::move(reason)) {}

const char* toString(DaemonizeStage stage) noexcept {
    switch (stage) {
        case DaemonizeStage::Prepare:
            return "prepare";
        case DaemonizeStage::Fork:
            return "fork";
        case DaemonizeStage::Session:
            return "setsid";
        case DaemonizeStage::SecondFork:
            return "second fork";
        case DaemonizeStage::Chdir:
            return "chdir";
        case DaemonizeStage::Redirect:
            return "redirect";
        case DaemonizeStage::SwitchUser:
            return "switch user";
    }
    return "unknown";
}

DaemonizeError::DaemonizeError(DaemonizeStage stage, const std::string& message,
                               std::error_code code, std::string path)
    : ProcessGuardError(std::string("Daemonize failed at ") + toString(stage) +
                            ": " + message,
                        std::move(path), code),
      stage_(stage) {}

}  // namespace procguard
