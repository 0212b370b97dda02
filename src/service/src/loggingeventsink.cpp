/**
 * @file loggingeventsink.cpp
 * @brief Реализация LoggingEventSink
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "loggingeventsink.hpp"

#include <utility>

namespace procguard {

LoggingEventSink::LoggingEventSink(std::shared_ptr<ILogger> logger,
                                   std::function<void()> onDetached)
    : logger_(std::move(logger)), onDetached_(std::move(onDetached)) {}

LogLevel LoggingEventSink::levelFor(EventKind kind) noexcept {
    switch (kind) {
        case EventKind::LockStaleTakeover:
        case EventKind::LockTimedOut:
        case EventKind::PidFileStale:
        case EventKind::PidFileRestored:
            return LogLevel::LOG_WARNING;
        case EventKind::ServiceFailed:
            return LogLevel::LOG_ERROR;
        case EventKind::LockAcquired:
        case EventKind::LockReleased:
            return LogLevel::LOG_DEBUG;
        default:
            return LogLevel::LOG_INFO;
    }
}

void LoggingEventSink::operator()(const ProcessEvent& event) const {
    if (event.kind == EventKind::DaemonDetached && onDetached_) {
        onDetached_();
    }
    if (!logger_) return;

    const std::string message = describeEvent(event);
    switch (levelFor(event.kind)) {
        case LogLevel::LOG_DEBUG:
            logger_->debug(message);
            break;
        case LogLevel::LOG_WARNING:
            logger_->warning(message);
            break;
        case LogLevel::LOG_ERROR:
            logger_->error(message);
            break;
        case LogLevel::LOG_CRITICAL:
            logger_->critical(message);
            break;
        default:
            logger_->info(message);
            break;
    }
}

}  // namespace procguard
