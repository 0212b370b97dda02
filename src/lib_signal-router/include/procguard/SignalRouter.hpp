/**
 * @file SignalRouter.hpp
 * @brief Асинхронный маршрутизатор POSIX-сигналов
 *
 * @author procguard Development Team
 * @date Сентябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details Реализует обработку сигналов через signalfd и epoll в отдельном
 * потоке. Обработчики выполняются в этом потоке как обычный код, поэтому
 * ограничения async-signal-safe на них не распространяются.
 */
#pragma once

#include <sys/signalfd.h>
#include <unistd.h>

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace procguard {

/**
 * @class SignalRouter
 * @brief Потокобезопасный менеджер обработки сигналов
 *
 * @note Основные возможности:
 * - Асинхронная обработка через отдельный поток
 * - Поддержка нескольких обработчиков на сигнал
 * - Восстановление исходной маски сигналов в деструкторе
 *
 * @warning
 * - Только для Linux систем
 * - Не поддерживает SIGKILL и SIGSTOP
 * - Объект создаётся до запуска других потоков: маска сигналов
 *   наследуется потоками, созданными позже
 */
class SignalRouter {
public:
    using Handler = std::function<void(int)>;  ///< Тип обработчика сигналов

    /**
     * @throw std::system_error При ошибке sigprocmask или signalfd
     */
    SignalRouter();

    /**
     * @brief Деструктор
     * @note Вызывает stop() и восстанавливает исходную маску сигналов
     */
    ~SignalRouter();

    SignalRouter(const SignalRouter&) = delete;
    SignalRouter& operator=(const SignalRouter&) = delete;

    /**
     * @brief Зарегистрировать обработчик для сигнала
     * @param signum Номер сигнала (например, SIGINT)
     * @param handler Функция-обработчик
     * @throw std::invalid_argument При неверном номере сигнала
     * @throw std::system_error При ошибках системных вызовов
     *
     * @note Блокирует сигнал в вызывающем потоке и добавляет его в signalfd
     *
     * @code
     * router.registerHandler(SIGTERM, [&](int) { guard.requestShutdown(); });
     * @endcode
     */
    void registerHandler(int signum, Handler handler);

    /**
     * @brief Удалить все обработчики для сигнала
     * @throw std::invalid_argument При неверном номере сигнала
     *
     * @note Восстанавливает стандартное поведение для сигнала, если он не
     * был заблокирован до создания маршрутизатора
     */
    void unregisterHandler(int signum);

    /**
     * @brief Запустить поток обработки сигналов
     * @throw std::system_error При ошибках epoll
     */
    void start();

    /**
     * @brief Остановить обработку сигналов
     * @note Дожидается завершения рабочего потока
     */
    void stop() noexcept;

    bool isRunning() const noexcept { return running_; }

private:
    void processSignals();  ///< Основной цикл обработки
    void dispatch(int signum);

    std::unordered_map<int, std::vector<Handler>>
        handlers_;               ///< Регистр обработчиков
    std::mutex handlers_mutex_;  ///< Мьютекс для потокобезопасности
    std::atomic<bool> running_{false};  ///< Флаг работы потока
    std::thread worker_thread_;         ///< Поток обработки
    int signal_fd_ = -1;                ///< Дескриптор signalfd
    int epoll_fd_ = -1;                 ///< Дескриптор epoll
    sigset_t original_mask_;            ///< Исходная маска сигналов
    sigset_t blocked_mask_{};           ///< Сигналы, принимаемые через signalfd
};

/// Короткое имя сигнала без префикса SIG ("TERM", "HUP", ...)
std::string signalName(int signum);

}  // namespace procguard
