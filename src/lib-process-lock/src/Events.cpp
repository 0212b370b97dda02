/**
 * @file Events.cpp
 * @brief Текстовое описание событий и их доставка
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "procguard/Events.hpp"

#include <iomanip>
#include <sstream>

namespace procguard {

const char* eventKindName(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::LockAcquired:
            return "LockAcquired";
        case EventKind::LockStaleTakeover:
            return "LockStaleTakeover";
        case EventKind::LockTimedOut:
            return "LockTimedOut";
        case EventKind::LockReleased:
            return "LockReleased";
        case EventKind::PidFileCreated:
            return "PidFileCreated";
        case EventKind::PidFileStale:
            return "PidFileStale";
        case EventKind::PidFileRemoved:
            return "PidFileRemoved";
        case EventKind::PidFileRestored:
            return "PidFileRestored";
        case EventKind::DaemonDetached:
            return "DaemonDetached";
        case EventKind::SignalReceived:
            return "SignalReceived";
        case EventKind::ServiceStopping:
            return "ServiceStopping";
        case EventKind::ServiceFailed:
            return "ServiceFailed";
    }
    return "Unknown";
}

std::string describeEvent(const ProcessEvent& event) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    switch (event.kind) {
        case EventKind::LockAcquired:
            oss << "Lock " << event.path << " acquired by PID " << event.pid
                << " after " << event.elapsed.count() << " s";
            break;
        case EventKind::LockStaleTakeover:
            oss << "Stale lock " << event.path << " of PID " << event.other_pid
                << " taken over by PID " << event.pid;
            break;
        case EventKind::LockTimedOut:
            oss << "Timeout after " << event.elapsed.count()
                << " s waiting for lock " << event.path;
            if (event.other_pid > 0) oss << " held by PID " << event.other_pid;
            break;
        case EventKind::LockReleased:
            oss << "Lock " << event.path << " released by PID " << event.pid;
            break;
        case EventKind::PidFileCreated:
            oss << "PID file " << event.path << " written with PID " << event.pid;
            break;
        case EventKind::PidFileStale:
            oss << "Stale PID file " << event.path;
            if (event.other_pid > 0) {
                oss << " of dead process " << event.other_pid;
            }
            break;
        case EventKind::PidFileRemoved:
            oss << "PID file " << event.path << " removed";
            break;
        case EventKind::PidFileRestored:
            oss << "PID file " << event.path << " restored with PID " << event.pid;
            break;
        case EventKind::DaemonDetached:
            oss << "Detached from terminal, PID " << event.other_pid << " -> "
                << event.pid;
            break;
        case EventKind::SignalReceived:
            oss << "Got a signal";
            break;
        case EventKind::ServiceStopping:
            oss << "Stopping service PID " << event.pid;
            break;
        case EventKind::ServiceFailed:
            oss << "Service failure";
            if (!event.path.empty()) oss << " on " << event.path;
            break;
    }

    if (!event.detail.empty()) {
        oss << ": " << event.detail;
    }
    return oss.str();
}

void emitEvent(const EventSink& sink, const ProcessEvent& event) {
    if (sink) sink(event);
}

}  // namespace procguard
