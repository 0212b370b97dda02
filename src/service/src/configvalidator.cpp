/**
 * @file configvalidator.cpp
 * @brief Реализация валидатора структуры JSON-конфигурации
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */
#include "configvalidator.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace procguard {

void ConfigValidator::validate(const nlohmann::json &config) const {
    validateRoot(config);
    validatePidFile(config["pidfile"]);
    if (config.contains("lock")) validateLock(config["lock"]);
    if (config.contains("daemon")) validateDaemon(config["daemon"]);
    if (config.contains("locks")) validateLocks(config["locks"]);
    if (config.contains("logging")) validateLogging(config["logging"]);
    if (config.contains("recheck_interval")) {
        if (!config["recheck_interval"].is_number() ||
            config["recheck_interval"].get<double>() <= 0) {
            throw std::runtime_error(
                "ConfigValidator: recheck_interval must be a positive number");
        }
    }
}

bool ConfigValidator::validateRoot(const nlohmann::json &config) const {
    if (!config.is_object()) {
        throw std::runtime_error("ConfigValidator: Root must be an object");
    }

    const std::vector<std::string> object_sections = {"pidfile", "lock",
                                                      "daemon"};
    for (const auto &section : object_sections) {
        if (config.contains(section) && !config[section].is_object()) {
            throw std::runtime_error("ConfigValidator: Section must be an object: " +
                                     section);
        }
    }

    if (!config.contains("pidfile")) {
        throw std::runtime_error(
            "ConfigValidator: Missing required section: pidfile");
    }
    return true;
}

bool ConfigValidator::validatePidFile(const nlohmann::json &pidfile) const {
    if (!pidfile.contains("path")) {
        throw std::runtime_error(
            "ConfigValidator: Missing required field in pidfile: path");
    }
    requireString(pidfile, "pidfile", "path");
    if (pidfile["path"].get<std::string>().empty()) {
        throw std::runtime_error("ConfigValidator: pidfile.path cannot be empty");
    }
    requireBoolean(pidfile, "pidfile", "auto_remove");
    return true;
}

bool ConfigValidator::validateLock(const nlohmann::json &lock) const {
    requireString(lock, "lock", "directory");
    for (const char *field :
         {"start_delay", "delay_increase", "max_delay", "timeout"}) {
        requireNumber(lock, "lock", field);
    }
    if (lock.contains("max_age") && !lock["max_age"].is_null()) {
        requireNumber(lock, "lock", "max_age");
    }
    requireBoolean(lock, "lock", "use_pid");
    return true;
}

bool ConfigValidator::validateDaemon(const nlohmann::json &daemon) const {
    requireBoolean(daemon, "daemon", "enabled");
    for (const char *field : {"workdir", "stdout", "stderr", "user", "group"}) {
        requireString(daemon, "daemon", field);
    }
    if (daemon.contains("umask") && !daemon["umask"].is_string() &&
        !daemon["umask"].is_number_unsigned()) {
        throw std::runtime_error(
            "ConfigValidator: daemon.umask must be an octal string or a number");
    }
    return true;
}

bool ConfigValidator::validateLocks(const nlohmann::json &locks) const {
    if (!locks.is_array()) {
        throw std::runtime_error("ConfigValidator: Locks must be an array");
    }

    const std::vector<std::string> required_fields = {"resource", "path"};

    for (const auto &lock : locks) {
        if (!lock.is_object()) {
            throw std::runtime_error("ConfigValidator: Lock entry must be an object");
        }

        for (const auto &field : required_fields) {
            if (!lock.contains(field)) {
                throw std::runtime_error(
                    "ConfigValidator: Missing required field in lock: " + field);
            }
            if (!lock[field].is_string() || lock[field].get<std::string>().empty()) {
                throw std::runtime_error("ConfigValidator: Invalid type in lock: " +
                                         field);
            }
        }
    }
    return true;
}

bool ConfigValidator::validateLogging(const nlohmann::json &logging) const {
    if (!logging.is_array()) {
        throw std::runtime_error(
            "ConfigValidator: Logging config must be an array");
    }

    const std::vector<std::string> valid_types = {"console", "file"};

    for (const auto &logger : logging) {
        if (!logger.is_object()) {
            throw std::runtime_error(
                "ConfigValidator: Logger entry must be an object");
        }

        if (!logger.contains("type") || !logger["type"].is_string()) {
            throw std::runtime_error("ConfigValidator: Logger missing type field");
        }

        const std::string type = logger["type"].get<std::string>();
        if (std::find(valid_types.begin(), valid_types.end(), type) ==
            valid_types.end()) {
            throw std::runtime_error("ConfigValidator: Invalid logger type: " +
                                     type);
        }

        if (logger.contains("level") && !logger["level"].is_string()) {
            throw std::runtime_error("ConfigValidator: Invalid log level type");
        }

        if (type == "file" &&
            (!logger.contains("file") || !logger["file"].is_string())) {
            throw std::runtime_error(
                "ConfigValidator: File logger missing file path");
        }
    }
    return true;
}

void ConfigValidator::requireNumber(const nlohmann::json &section,
                                    const char *section_name,
                                    const char *field) const {
    if (section.contains(field) && !section[field].is_number()) {
        throw std::runtime_error(std::string("ConfigValidator: ") + section_name +
                                 "." + field + " must be a number");
    }
}

void ConfigValidator::requireString(const nlohmann::json &section,
                                    const char *section_name,
                                    const char *field) const {
    if (section.contains(field) && !section[field].is_string()) {
        throw std::runtime_error(std::string("ConfigValidator: ") + section_name +
                                 "." + field + " must be a string");
    }
}

void ConfigValidator::requireBoolean(const nlohmann::json &section,
                                     const char *section_name,
                                     const char *field) const {
    if (section.contains(field) && !section[field].is_boolean()) {
        throw std::runtime_error(std::string("ConfigValidator: ") + section_name +
                                 "." + field + " must be a boolean");
    }
}

}  // namespace procguard
