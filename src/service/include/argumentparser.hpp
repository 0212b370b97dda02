/**
 * @file argumentparser.hpp
 * @brief Парсер аргументов командной строки procguardd
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 *
 * @details
 * Поддерживаются формы `--key=value` и `--key value`. Значения из командной
 * строки имеют приоритет над конфигурационным файлом.
 */
#pragma once

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace procguard {

struct ParsedArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> pidfile;
    /// true для --daemon, false для --foreground, пусто, если не задано
    std::optional<bool> daemon_mode;
    std::optional<std::string> log_level;
    std::vector<std::string> logger_types;
    bool status = false;
    bool stop = false;
    bool help_message = false;
    bool version_message = false;
};

/**
 * @class ArgumentParser
 * @brief Разбор и проверка параметров запуска
 *
 * @throw std::invalid_argument При неизвестном параметре, отсутствующем
 *        значении или недопустимом уровне/типе логгера
 */
class ArgumentParser {
public:
    ParsedArgs parse(int argc, char **argv);

    static void printHelp(std::ostream &out);

private:
    static const std::vector<std::string> validLogLevels;
    static const std::vector<std::string> validLogTypes;

    std::string takeValue(const std::string &name, const std::string &arg,
                          int &i, int argc, char **argv) const;
    void parseLogType(const std::string &value, ParsedArgs &args) const;
    void validateLogLevel(const std::string &level) const;
    void validateLogTypes(const std::vector<std::string> &types) const;
};

}  // namespace procguard
