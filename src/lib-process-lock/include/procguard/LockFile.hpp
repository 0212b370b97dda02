/**
 * @file LockFile.hpp
 * @brief Межпроцессная блокировка на основе файла-маркера
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Взаимное исключение обеспечивает только атомарное эксклюзивное
 * создание маркера. Проверка pid и возраста маркера лишь определяет,
 * можно ли считать чужую блокировку устаревшей.
 *
 * @warning Объект не предназначен для одновременного использования из
 * нескольких потоков одного процесса на одном и том же пути.
 */
#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "procguard/Events.hpp"
#include "procguard/MarkerFile.hpp"
#include "procguard/ProcessProbe.hpp"

namespace procguard {

/**
 * @struct RetryPolicy
 * @brief Параметры повторных попыток и устаревания блокировки
 */
struct RetryPolicy {
    using Seconds = std::chrono::duration<double>;

    Seconds start_delay{0.1};     ///< Первая пауза между попытками
    Seconds delay_increase{0.2};  ///< Прирост паузы после каждой попытки
    Seconds max_delay{10.0};      ///< Верхняя граница паузы
    /// Возраст, после которого маркер устарел (если pid не используется).
    /// nullopt: по возрасту маркер не устаревает никогда.
    std::optional<Seconds> max_age{Seconds(300.0)};
    bool use_pid = true;  ///< Учитывать жизнь процесса-владельца

    /// @throw std::invalid_argument При недопустимых значениях
    void validate() const;
};

enum class LockState {
    Absent,  ///< Маркера нет
    Held,    ///< Маркер действителен
    Stale    ///< Маркер можно удалить
};

const char* toString(LockState state) noexcept;

/// Результат проверки маркера
struct LockStatus {
    LockState state = LockState::Absent;
    std::optional<MarkerSnapshot> marker;
    bool probed = false;                     ///< Проводилась ли проверка pid
    Liveness liveness = Liveness::Unknown;   ///< Значимо, только если probed
    std::chrono::duration<double> age{};     ///< Возраст маркера

    /// pid владельца или 0, если он не разобран
    pid_t holder() const {
        return marker && marker->record.pid ? *marker->record.pid : 0;
    }
};

/**
 * @brief Вердикт об устаревании маркера
 *
 * @details При use_pid и разобранном pid решает только проверка процесса:
 * мёртвый процесс означает устаревание, живой или недоступный (Unknown) -
 * действующую блокировку независимо от возраста. Иначе маркер устарел,
 * когда его возраст достиг max_age.
 */
LockStatus classifyMarker(std::optional<MarkerSnapshot> marker,
                          const RetryPolicy& policy, const IProcessProbe& probe,
                          Clock::time_point now);

/**
 * @class LockHandle
 * @brief Сведения о полученной блокировке
 */
class LockHandle {
public:
    LockHandle() = default;

    const std::string& resourceId() const { return resource_id_; }
    const std::filesystem::path& path() const { return path_; }
    pid_t holderPid() const { return holder_pid_; }
    Clock::time_point createdAt() const { return created_at_; }
    bool valid() const { return valid_; }

private:
    friend class LockFile;

    LockHandle(std::string resource_id, std::filesystem::path path,
               pid_t holder_pid, Clock::time_point created_at);

    std::string resource_id_;
    std::filesystem::path path_;
    pid_t holder_pid_ = 0;
    Clock::time_point created_at_{};
    bool valid_ = false;
};

/**
 * @class LockFile
 * @brief Получение, проверка и освобождение файловых блокировок
 *
 * @code
 * procguard::LockFile locks("/var/lock", sink);
 * auto handle = locks.acquire("spool", "spool.lock", {}, std::chrono::seconds(5));
 * // ... работа с ресурсом ...
 * locks.release(handle);
 * @endcode
 */
class LockFile {
public:
    explicit LockFile(std::filesystem::path lockDir = "/var/lock",
                      EventSink sink = EventSink(),
                      std::shared_ptr<IProcessProbe> probe = nullptr);

    const std::filesystem::path& lockDir() const { return lockDir_; }

    /// Абсолютный путь маркера; относительные пути берутся от lockDir
    std::filesystem::path resolve(const std::filesystem::path& lockPath) const;

    /**
     * @brief Получить блокировку
     * @param resourceId Логическое имя ресурса
     * @param lockPath Путь маркера (относительный - от lockDir)
     * @param policy Параметры повторов и устаревания
     * @param timeout Общий таймаут; ноль означает одну попытку
     * @param pid pid для записи в маркер, 0 - текущий процесс
     * @throw LockTimeout Таймаут истёк
     * @throw LockIOError Ошибка файловой системы (не повторяется)
     * @throw std::invalid_argument Неверные параметры
     */
    LockHandle acquire(const std::string& resourceId,
                       const std::filesystem::path& lockPath,
                       const RetryPolicy& policy,
                       std::chrono::duration<double> timeout, pid_t pid = 0);

    /**
     * @brief Освободить блокировку
     * @throw LockOwnershipError Маркер на диске заменён другим; файл не трогается
     * @throw LockIOError Ошибка файловой системы
     */
    void release(LockHandle& handle);

    /// Проверить маркер без попытки захвата
    LockStatus check(const std::filesystem::path& lockPath,
                     const RetryPolicy& policy) const;

private:
    void ensureLockDirectory(const std::filesystem::path& path) const;
    bool takeOver(const std::filesystem::path& path, const MarkerSnapshot& judged);

    std::filesystem::path lockDir_;
    EventSink sink_;
    std::shared_ptr<IProcessProbe> probe_;
};

}  // namespace procguard
