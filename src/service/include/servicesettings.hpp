/**
 * @file servicesettings.hpp
 * @brief Настройки procguardd, собранные из JSON-конфигурации и CLI
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */
#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "argumentparser.hpp"
#include "procguard/ServiceGuard.hpp"

namespace procguard {

struct LoggerSettings {
    std::string type = "console";  ///< console | file
    std::string level = "info";
    std::string file;  ///< Только для type == "file"
};

/**
 * @struct ServiceSettings
 * @brief Полный набор параметров запуска сервиса
 *
 * @code
 * auto settings = procguard::ServiceSettings::fromJson(config);
 * settings.applyArguments(args);
 * procguard::ServiceGuard guard(settings.guard, sink);
 * @endcode
 */
struct ServiceSettings {
    static constexpr const char *kDefaultPidFile = "/var/run/procguardd.pid";
    static constexpr const char *kDefaultLogFile = "procguardd.log";

    GuardSettings guard;
    std::vector<LoggerSettings> loggers;
    std::chrono::duration<double> recheck_interval{5.0};

    /// Значения по умолчанию без конфигурационного файла
    static ServiceSettings defaults();

    /**
     * @brief Построить настройки из проверенной конфигурации
     * @throw std::invalid_argument При недопустимых значениях (umask, задержки)
     */
    static ServiceSettings fromJson(const nlohmann::json &config);

    /// Применить переопределения из командной строки
    void applyArguments(const ParsedArgs &args);
};

/// Разбор umask: восьмеричная строка ("027") или число
mode_t parseUmask(const nlohmann::json &value);

}  // namespace procguard
