/**
 * @file service_controller.hpp
 * @brief Класс управления жизненным циклом procguardd
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details
 * ServiceController объединяет разбор аргументов, загрузку конфигурации,
 * настройку логирования и ServiceGuard. Ошибки переводятся в коды
 * завершения (см. exitcodes.hpp).
 *
 * @note Не потокобезопасен при параллельном вызове run()
 */
#pragma once

#include <iostream>
#include <memory>
#include <ostream>
#include <vector>

#include "argumentparser.hpp"
#include "procguard/compositelogger.hpp"
#include "procguard/filelogger.hpp"
#include "servicesettings.hpp"

namespace procguard {

/**
 * @class ServiceController
 * @brief Управляет запуском, конфигурацией и жизненным циклом сервиса
 *
 * Этапы run():
 * 1. Парсинг и валидация CLI аргументов
 * 2. Загрузка конфигурации и применение CLI-переопределений
 * 3. --status / --stop, либо
 * 4. инициализация логгера, ServiceGuard::start(), ожидание сигнала
 *    завершения и ServiceGuard::stop()
 *
 * @code
 int main(int argc, char** argv) {
     procguard::ServiceController controller;
     return controller.run(argc, argv);
 }
 @endcode
 */
class ServiceController {
public:
    explicit ServiceController(std::ostream &out = std::cout,
                               std::ostream &err = std::cerr);

    /**
     * @brief Основная точка входа сервиса
     * @return Код завершения процесса
     */
    int run(int argc, char **argv);

private:
    ServiceSettings loadSettings(const ParsedArgs &args) const;
    void initLogger(const ServiceSettings &settings);
    void reopenFileLoggers();

    int reportStatus(const ServiceSettings &settings);
    int stopRunning(const ServiceSettings &settings);
    int serve(const ServiceSettings &settings);

    void printVersion();

    std::ostream &out_;
    std::ostream &err_;
    std::shared_ptr<CompositeLogger> logger_;
    std::vector<std::shared_ptr<FileLogger>> fileLoggers_;
    bool hasConsole_ = false;
};

}  // namespace procguard
