/**
 * @file servicesettings.cpp
 * @brief Сборка ServiceSettings из JSON и командной строки
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "servicesettings.hpp"

#include <stdexcept>

#include "procguard/ilogger.hpp"

namespace procguard {

namespace {

RetryPolicy::Seconds seconds(double value) {
    return RetryPolicy::Seconds(value);
}

}  // namespace

mode_t parseUmask(const nlohmann::json &value) {
    unsigned long mask = 0;
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        size_t consumed = 0;
        try {
            mask = std::stoul(text, &consumed, 8);
        } catch (const std::logic_error &) {
            throw std::invalid_argument("Invalid umask: " + text);
        }
        if (consumed != text.size()) {
            throw std::invalid_argument("Invalid umask: " + text);
        }
    } else if (value.is_number_unsigned()) {
        mask = value.get<unsigned long>();
    } else {
        throw std::invalid_argument("Invalid umask type");
    }
    if (mask > 0777) {
        throw std::invalid_argument("umask out of range: " + std::to_string(mask));
    }
    return static_cast<mode_t>(mask);
}

ServiceSettings ServiceSettings::defaults() {
    ServiceSettings settings;
    settings.guard.pidfile = kDefaultPidFile;
    settings.loggers.push_back(LoggerSettings());
    return settings;
}

ServiceSettings ServiceSettings::fromJson(const nlohmann::json &config) {
    ServiceSettings settings = defaults();
    GuardSettings &guard = settings.guard;

    const auto &pidfile = config.at("pidfile");
    guard.pidfile = pidfile.at("path").get<std::string>();
    guard.pidfile_auto_remove = pidfile.value("auto_remove", true);

    if (config.contains("lock")) {
        const auto &lock = config["lock"];
        guard.lock_dir = lock.value("directory", guard.lock_dir.string());
        guard.retry.start_delay =
            seconds(lock.value("start_delay", guard.retry.start_delay.count()));
        guard.retry.delay_increase = seconds(
            lock.value("delay_increase", guard.retry.delay_increase.count()));
        guard.retry.max_delay =
            seconds(lock.value("max_delay", guard.retry.max_delay.count()));
        if (lock.contains("max_age")) {
            if (lock["max_age"].is_null()) {
                guard.retry.max_age.reset();
            } else {
                guard.retry.max_age = seconds(lock["max_age"].get<double>());
            }
        }
        guard.retry.use_pid = lock.value("use_pid", guard.retry.use_pid);
        guard.lock_timeout = seconds(lock.value("timeout", guard.lock_timeout.count()));
        if (guard.lock_timeout.count() < 0) {
            throw std::invalid_argument("lock.timeout cannot be negative");
        }
        guard.retry.validate();
    }

    if (config.contains("daemon")) {
        const auto &daemon = config["daemon"];
        guard.daemonize = daemon.value("enabled", false);
        guard.daemon.workdir = daemon.value("workdir", std::string("/"));
        if (daemon.contains("umask")) {
            guard.daemon.umask = parseUmask(daemon["umask"]);
        }
        guard.daemon.stdout_target =
            RedirectTarget::parse(daemon.value("stdout", std::string("discard")));
        guard.daemon.stderr_target =
            RedirectTarget::parse(daemon.value("stderr", std::string("discard")));
        guard.daemon.user = daemon.value("user", std::string());
        guard.daemon.group = daemon.value("group", std::string());
    }

    if (config.contains("locks")) {
        for (const auto &entry : config["locks"]) {
            guard.locks.push_back({entry.at("resource").get<std::string>(),
                                   entry.at("path").get<std::string>()});
        }
    }

    if (config.contains("logging")) {
        settings.loggers.clear();
        for (const auto &entry : config["logging"]) {
            LoggerSettings logger;
            logger.type = entry.value("type", "console");
            logger.level = entry.value("level", "info");
            logger.file = entry.value("file", std::string(kDefaultLogFile));
            // проверяем уровень сразу, а не при создании логгера
            stringToLogLevel(logger.level);
            settings.loggers.push_back(logger);
        }
    }

    settings.recheck_interval = seconds(
        config.value("recheck_interval", settings.recheck_interval.count()));
    return settings;
}

void ServiceSettings::applyArguments(const ParsedArgs &args) {
    if (args.pidfile) guard.pidfile = *args.pidfile;
    if (args.daemon_mode) guard.daemonize = *args.daemon_mode;

    if (!args.logger_types.empty()) {
        std::vector<LoggerSettings> fromCli;
        for (const auto &type : args.logger_types) {
            LoggerSettings logger;
            logger.type = type;
            if (type == "file") {
                // путь берём из конфигурации, если файловый логгер там был
                logger.file = kDefaultLogFile;
                for (const auto &configured : loggers) {
                    if (configured.type == "file") logger.file = configured.file;
                }
            }
            fromCli.push_back(logger);
        }
        loggers = fromCli;
    }

    if (args.log_level) {
        for (auto &logger : loggers) logger.level = *args.log_level;
    }
}

}  // namespace procguard
