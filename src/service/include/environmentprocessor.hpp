/**
 * @file environmentprocessor.hpp
 * @brief Подстановка значений переменных окружения в JSON-конфигурацию
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details
 * Во всех строковых узлах конфигурации шаблоны `$ENV{VAR}` заменяются
 * значением переменной окружения VAR.
 *
 * @warning Шаблоны остаются неизменными, если переменная не установлена
 */

#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace procguard {

/**
 * @class EnvironmentProcessor
 * @brief Обработка шаблонов переменных окружения в конфиге
 *
 * @code
 nlohmann::json cfg = R"({"pidfile": {"path": "$ENV{HOME}/app.pid"}})"_json;
 procguard::EnvironmentProcessor ep;
 ep.process(cfg);
 @endcode
 */
class EnvironmentProcessor {
public:
    void process(nlohmann::json &config) const;

    /// Заменяет все вхождения `$ENV{VAR}` в строке
    void resolveVariable(std::string &value) const;

private:
    void walkJson(nlohmann::json &node,
                  const std::function<void(std::string &)> &func) const;
};

}  // namespace procguard
