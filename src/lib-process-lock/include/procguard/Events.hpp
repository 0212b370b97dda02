/**
 * @file Events.hpp
 * @brief Структурированные события жизненного цикла процесса
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Ядро не пишет в журнал само: оно сообщает события через
 * EventSink, а приложение решает, как их отобразить.
 */
#pragma once

#include <sys/types.h>

#include <chrono>
#include <functional>
#include <string>

namespace procguard {

enum class EventKind {
    LockAcquired,
    LockStaleTakeover,
    LockTimedOut,
    LockReleased,
    PidFileCreated,
    PidFileStale,
    PidFileRemoved,
    PidFileRestored,
    DaemonDetached,
    SignalReceived,
    ServiceStopping,
    ServiceFailed
};

struct ProcessEvent {
    EventKind kind;
    std::string path;                        ///< Файл, к которому относится событие
    pid_t pid = 0;                           ///< Текущий (или новый) pid
    pid_t other_pid = 0;                     ///< Чужой или прежний pid
    std::chrono::duration<double> elapsed{}; ///< Время ожидания или возраст
    std::string detail;                      ///< Свободный текст
};

using EventSink = std::function<void(const ProcessEvent&)>;

const char* eventKindName(EventKind kind) noexcept;

/// Человекочитаемое описание события для журнала
std::string describeEvent(const ProcessEvent& event);

/// Передать событие в sink, если он задан
void emitEvent(const EventSink& sink, const ProcessEvent& event);

}  // namespace procguard
