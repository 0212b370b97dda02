/**
 * @file Daemonizer.hpp
 * @brief Отсоединение процесса от терминала (двойной fork)
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Последовательность фаз строго прямая:
 * Foreground -> Forked -> SessionLeader -> Detached.
 * Объект используется один раз за время жизни процесса.
 *
 * @note Файлы для перенаправления вывода открываются и пользователь
 * разрешается до первого fork, поэтому эти ошибки видны вызывающему
 * синхронно. После первого fork терминала для сообщений уже нет.
 */
#pragma once

#include <sys/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "procguard/Events.hpp"
#include "procguard/SystemCalls.hpp"

namespace procguard {

enum class DaemonPhase { Foreground, Forked, SessionLeader, Detached };

const char* toString(DaemonPhase phase) noexcept;

enum class RedirectKind {
    Discard,  ///< /dev/null
    File,     ///< Дописывать в файл
    Inherit   ///< Оставить унаследованный дескриптор
};

struct RedirectTarget {
    RedirectKind kind = RedirectKind::Discard;
    std::string path;  ///< Только для RedirectKind::File

    static RedirectTarget discard() { return {RedirectKind::Discard, {}}; }
    static RedirectTarget file(std::string path) {
        return {RedirectKind::File, std::move(path)};
    }
    static RedirectTarget inherit() { return {RedirectKind::Inherit, {}}; }

    /// "discard", "inherit" или путь к файлу
    static RedirectTarget parse(const std::string& text);
};

struct DaemonSettings {
    std::filesystem::path workdir = "/";
    mode_t umask = 0;
    RedirectTarget stdout_target;
    RedirectTarget stderr_target;
    std::string user;   ///< Пусто - не менять пользователя
    std::string group;  ///< Пусто - основная группа пользователя
    bool close_fds = true;  ///< Закрыть унаследованные дескрипторы выше 2
};

/// Результат демонизации
struct DetachResult {
    pid_t original_pid = 0;  ///< pid процесса, вызвавшего daemonize()
    pid_t daemon_pid = 0;    ///< pid итогового процесса-демона
};

/**
 * @class Daemonizer
 * @brief Конечный автомат демонизации
 *
 * @code
 * procguard::Daemonizer daemonizer(settings, sink);
 * auto result = daemonizer.daemonize();  // возвращается уже в демоне
 * pidfile.recreate(result.daemon_pid);
 * @endcode
 */
class Daemonizer {
public:
    explicit Daemonizer(DaemonSettings settings, EventSink sink = EventSink(),
                        std::shared_ptr<ISystemCalls> sys = nullptr);

    Daemonizer(const Daemonizer&) = delete;
    Daemonizer& operator=(const Daemonizer&) = delete;

    DaemonPhase phase() const { return phase_; }
    const DaemonSettings& settings() const { return settings_; }

    /**
     * @brief Демонизировать текущий процесс
     *
     * Родительские процессы обоих fork завершаются с кодом 0 внутри вызова.
     * Возврат происходит только в итоговом процессе.
     *
     * @throw DaemonizeError Сбой на одном из шагов (см. stage())
     * @throw std::logic_error Повторный вызов
     */
    DetachResult daemonize();

private:
    struct Credentials {
        std::string user;
        uid_t uid = 0;
        gid_t gid = 0;
        bool switch_user = false;
        bool switch_group = false;
    };

    struct Streams {
        int null_fd = -1;
        int stdout_fd = -1;
        int stderr_fd = -1;
    };

    Credentials resolveCredentials() const;
    Streams openStreams();
    int openTarget(const RedirectTarget& target, int nullFd);
    void closeStreams(Streams& streams);
    void redirect(Streams& streams);
    void switchUser(const Credentials& credentials);
    void exitParent();

    DaemonSettings settings_;
    EventSink sink_;
    std::shared_ptr<ISystemCalls> sys_;
    DaemonPhase phase_ = DaemonPhase::Foreground;
    bool used_ = false;
};

}  // namespace procguard
