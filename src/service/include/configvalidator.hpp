/**
 * @file configvalidator.hpp
 * @brief Валидация структуры JSON-конфигурации procguardd
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details
 * Класс **ConfigValidator** проверяет структуру конфигурации до её
 * применения:
 * - обязательная секция `"pidfile"` с полем `"path"`
 * - необязательные секции `"lock"`, `"daemon"`, `"locks"`, `"logging"`
 *   и поле `"recheck_interval"` с корректными типами
 *
 * Все методы бросают std::runtime_error с префиксом "ConfigValidator:".
 */

#pragma once

#include <nlohmann/json.hpp>

namespace procguard {

/**
 * @class ConfigValidator
 * @brief Предоставляет методы валидации JSON-конфига сервиса
 *
 * @see ConfigLoader, ServiceSettings
 */
class ConfigValidator {
public:
    /**
     * @brief Полная проверка конфигурации
     * @throw std::runtime_error При первом найденном нарушении
     */
    void validate(const nlohmann::json &config) const;

    /// Корень должен быть объектом и содержать секцию "pidfile"
    bool validateRoot(const nlohmann::json &config) const;
    bool validatePidFile(const nlohmann::json &pidfile) const;

    /**
     * @brief Проверяет параметры повторных попыток блокировки
     *
     * Все задержки должны быть числами; `max_age` может быть null
     * (устаревание по возрасту отключено).
     */
    bool validateLock(const nlohmann::json &lock) const;
    bool validateDaemon(const nlohmann::json &daemon) const;

    /// Массив объектов с обязательными строковыми полями resource и path
    bool validateLocks(const nlohmann::json &locks) const;

    /**
     * @brief Проверяет секцию логирования
     *
     * Массив объектов с полем `"type"` из {console, file}; для файлового
     * логгера обязательно поле `"file"`.
     */
    bool validateLogging(const nlohmann::json &logging) const;

private:
    void requireNumber(const nlohmann::json &section, const char *section_name,
                       const char *field) const;
    void requireString(const nlohmann::json &section, const char *section_name,
                       const char *field) const;
    void requireBoolean(const nlohmann::json &section, const char *section_name,
                        const char *field) const;
};

}  // namespace procguard
