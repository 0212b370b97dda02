/**
 * @file configloader.hpp
 * @brief Загрузчик конфигурации procguardd из JSON-файла
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details
 * Читает файл целиком и разбирает его nlohmann/json. Путь последнего
 * загруженного файла запоминается для повторной загрузки.
 */

#pragma once

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace procguard {

/**
 * @class ConfigLoader
 * @brief Загрузчик конфигураций из JSON-файлов
 *
 * @note Класс не является потокобезопасным
 */
class ConfigLoader {
public:
    /**
     * @brief Загружает конфигурацию из указанного JSON-файла
     * @param[in] filename Путь к файлу конфигурации
     * @return Распарсенная конфигурация
     * @throw std::invalid_argument Если filename пустой
     * @throw std::runtime_error При ошибках открытия файла или синтаксиса JSON
     *
     * @code
     procguard::ConfigLoader loader;
     auto config = loader.loadFromFile("/etc/procguard/procguardd.json");
     @endcode
     */
    nlohmann::json loadFromFile(const std::string &filename);

    /**
     * @brief Повторно загружает последний файл
     * @throw std::runtime_error Если файл ещё не загружался
     */
    nlohmann::json reload() const;

    std::string getLastLoadedFile() const;
    bool hasLoadedFile() const;

private:
    nlohmann::json readFileContents(const std::string &filename) const;

    std::string lastLoadedFile;
};

}  // namespace procguard
