/**
 * @file loggingeventsink.hpp
 * @brief Вывод событий procguard в журнал
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include <functional>
#include <memory>

#include "procguard/Events.hpp"
#include "procguard/ilogger.hpp"

namespace procguard {

/**
 * @class LoggingEventSink
 * @brief Адаптер EventSink -> ILogger
 *
 * Текст сообщения строит describeEvent(), уровень выбирается по виду события.
 * Перед записью DaemonDetached вызывается detach-хук: после закрытия
 * унаследованных дескрипторов файловые логгеры нужно открыть заново.
 */
class LoggingEventSink {
public:
    explicit LoggingEventSink(std::shared_ptr<ILogger> logger,
                              std::function<void()> onDetached = nullptr);

    void operator()(const ProcessEvent& event) const;

    static LogLevel levelFor(EventKind kind) noexcept;

private:
    std::shared_ptr<ILogger> logger_;
    std::function<void()> onDetached_;
};

}  // namespace procguard
