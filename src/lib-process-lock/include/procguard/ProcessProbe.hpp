/**
 * @file ProcessProbe.hpp
 * @brief Проверка существования процесса нулевым сигналом
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @warning Результат эвристический: pid может быть переиспользован
 * между проверкой и последующими действиями.
 */
#pragma once

#include <sys/types.h>

#include <memory>

namespace procguard {

enum class Liveness {
    Alive,   ///< Процесс существует и доступен для сигналов
    Dead,    ///< Процесса нет (ESRCH), он зомби или pid недопустим
    Unknown  ///< Процесс есть, но принадлежит другому пользователю (EPERM)
};

/// Unknown трактуется как живой процесс
inline bool isAliveOrUnknown(Liveness liveness) {
    return liveness != Liveness::Dead;
}

const char* toString(Liveness liveness) noexcept;

class IProcessProbe {
public:
    virtual ~IProcessProbe() = default;
    virtual Liveness probe(pid_t pid) const = 0;
};

/// Реализация через kill(pid, 0) и состояние из /proc/<pid>/stat
class SignalProcessProbe : public IProcessProbe {
public:
    Liveness probe(pid_t pid) const override;
};

/// Общий экземпляр SignalProcessProbe
std::shared_ptr<IProcessProbe> defaultProcessProbe();

}  // namespace procguard
