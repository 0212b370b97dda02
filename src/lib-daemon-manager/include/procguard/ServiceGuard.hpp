/**
 * @file ServiceGuard.hpp
 * @brief Единый вызов "мы единственный работающий экземпляр"
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details ServiceGuard объединяет PidFile, Daemonizer и LockFile:
 * 1. PidFile.create() в исходном процессе: занятость файла видна сразу;
 * 2. Daemonizer (если включён), затем PidFile.recreate() в демоне;
 * 3. захват вспомогательных блокировок;
 * 4. обработка сигналов завершения и перепроверки PID-файла.
 *
 * После отсоединения ошибки доступны только через EventSink и код
 * завершения процесса.
 */
#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "procguard/Daemonizer.hpp"
#include "procguard/Events.hpp"
#include "procguard/LockFile.hpp"
#include "procguard/PidFile.hpp"
#include "procguard/ProcessProbe.hpp"
#include "procguard/SignalRouter.hpp"
#include "procguard/SystemCalls.hpp"

namespace procguard {

/// Дополнительный ресурс, блокируемый на время работы сервиса
struct AuxiliaryLock {
    std::string resource_id;
    std::filesystem::path path;  ///< Относительный путь берётся от lock_dir
};

struct GuardSettings {
    std::string pidfile;
    bool pidfile_auto_remove = true;  ///< Удалять PID-файл в stop()
    bool daemonize = false;
    DaemonSettings daemon;
    std::filesystem::path lock_dir = "/var/lock";
    RetryPolicy retry;
    std::chrono::duration<double> lock_timeout{10.0};
    std::vector<AuxiliaryLock> locks;
    bool handle_signals = true;  ///< Устанавливать обработчики сигналов
};

/// Сведения о запущенном сервисе
struct RunningService {
    pid_t original_pid = 0;  ///< pid процесса, вызвавшего start()
    pid_t pid = 0;           ///< pid работающего сервиса
    bool daemonized = false;
};

/**
 * @class ServiceGuard
 * @brief Жизненный цикл единственного экземпляра сервиса
 *
 * @code
 * procguard::ServiceGuard guard(settings, sink);
 * guard.start();
 * guard.waitForShutdown(std::chrono::seconds(30));
 * guard.stop();
 * @endcode
 *
 * @warning Объект нужно создавать в главном потоке до запуска других
 * потоков: иначе сигналы могут быть доставлены не в SignalRouter.
 */
class ServiceGuard {
public:
    explicit ServiceGuard(GuardSettings settings, EventSink sink = EventSink(),
                          std::shared_ptr<IProcessProbe> probe = nullptr,
                          std::shared_ptr<ISystemCalls> sys = nullptr);
    ~ServiceGuard();

    ServiceGuard(const ServiceGuard&) = delete;
    ServiceGuard& operator=(const ServiceGuard&) = delete;

    /**
     * @brief Запустить сервис
     * @param foreground_allowed Разрешена ли работа без демонизации
     * @throw PidFileInUseError Уже работает другой экземпляр
     * @throw PidFileError, InvalidPidFileError Ошибки PID-файла
     * @throw DaemonizeError Сбой демонизации
     * @throw LockTimeout, LockIOError Ошибки вспомогательных блокировок
     * @throw std::invalid_argument Демонизация выключена, а работа
     *        в foreground запрещена
     * @throw std::logic_error Повторный запуск
     */
    RunningService start(bool foreground_allowed = true);

    /**
     * @brief Освободить блокировки и удалить PID-файл
     * @note Идемпотентен, вызывается из деструктора. Ошибки сообщаются
     * событием ServiceFailed.
     */
    void stop();

    bool running() const { return running_; }
    /// Был ли обнаружен сбой после запуска (например, PID-файл перехвачен)
    bool failed() const;

    /// Запросить завершение (вызывается из обработчиков сигналов)
    void requestShutdown(int signum = 0);
    /// Запросить перепроверку PID-файла в главном потоке
    void requestRecheck();
    bool shutdownRequested() const;

    /**
     * @brief Блокировать вызывающий поток до запроса завершения
     * @param recheckInterval Период перепроверки PID-файла
     * @return Номер сигнала, вызвавшего завершение, или 0
     */
    int waitForShutdown(std::chrono::duration<double> recheckInterval);

    /**
     * @brief Проверить, что PID-файл по-прежнему наш
     *
     * Удалённый или испорченный файл восстанавливается. Если файл занят
     * другим живым процессом, сообщается ServiceFailed и запрашивается
     * завершение.
     *
     * @return false, если PID-файл потерян
     */
    bool recheck();

    const PidFile& pidFile() const { return pidfile_; }
    const std::vector<LockHandle>& locks() const { return handles_; }
    DaemonPhase daemonPhase() const { return daemonizer_.phase(); }

private:
    void acquireLocks();
    void releaseLocks();
    void cleanupAfterFailedStart();
    void installSignalHandlers();
    void reportFailure(const std::string& path, const std::string& detail);

    GuardSettings settings_;
    EventSink sink_;
    std::shared_ptr<ISystemCalls> sys_;
    PidFile pidfile_;
    LockFile lockFile_;
    Daemonizer daemonizer_;
    std::vector<LockHandle> handles_;
    std::unique_ptr<SignalRouter> router_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool started_ = false;
    bool running_ = false;
    bool shutdownRequested_ = false;
    bool recheckRequested_ = false;
    bool failed_ = false;
    int lastSignal_ = 0;
};

}  // namespace procguard
