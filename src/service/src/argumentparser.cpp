/**
 * @file argumentparser.cpp
 * @brief Реализация парсера аргументов командной строки
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "argumentparser.hpp"

#include <algorithm>
#include <ostream>

namespace procguard {

const std::vector<std::string> ArgumentParser::validLogLevels = {
    "debug", "info", "warning", "error", "critical"};

const std::vector<std::string> ArgumentParser::validLogTypes = {"console",
                                                                "file"};

namespace {

// Совпадает ли arg с name или с name=...
bool matches(const std::string &arg, const std::string &name) {
    return arg == name ||
           (arg.compare(0, name.size(), name) == 0 && arg.size() > name.size() &&
            arg[name.size()] == '=');
}

}  // namespace

ParsedArgs ArgumentParser::parse(int argc, char **argv) {
    ParsedArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help_message = true;
        } else if (arg == "--version" || arg == "-v") {
            args.version_message = true;
        } else if (arg == "--daemon" || arg == "-d") {
            if (args.daemon_mode == false) {
                throw std::invalid_argument(
                    "ArgumentParser: --daemon and --foreground are mutually exclusive");
            }
            args.daemon_mode = true;
        } else if (arg == "--foreground" || arg == "-f") {
            if (args.daemon_mode == true) {
                throw std::invalid_argument(
                    "ArgumentParser: --daemon and --foreground are mutually exclusive");
            }
            args.daemon_mode = false;
        } else if (arg == "--status") {
            args.status = true;
        } else if (arg == "--stop") {
            args.stop = true;
        } else if (matches(arg, "--config-file")) {
            args.config_path = takeValue("--config-file", arg, i, argc, argv);
        } else if (matches(arg, "--pidfile")) {
            args.pidfile = takeValue("--pidfile", arg, i, argc, argv);
        } else if (matches(arg, "--log-level")) {
            std::string level = takeValue("--log-level", arg, i, argc, argv);
            validateLogLevel(level);
            args.log_level = level;
        } else if (matches(arg, "--log-type")) {
            parseLogType(takeValue("--log-type", arg, i, argc, argv), args);
        } else {
            throw std::invalid_argument("ArgumentParser: Unknown argument: " + arg);
        }
    }

    if (args.status && args.stop) {
        throw std::invalid_argument(
            "ArgumentParser: --status and --stop are mutually exclusive");
    }
    validateLogTypes(args.logger_types);
    return args;
}

std::string ArgumentParser::takeValue(const std::string &name,
                                      const std::string &arg, int &i, int argc,
                                      char **argv) const {
    size_t eqPos = arg.find('=');
    std::string value;
    if (eqPos != std::string::npos) {
        value = arg.substr(eqPos + 1);
    } else if (i + 1 < argc) {
        value = argv[++i];
    } else {
        throw std::invalid_argument("ArgumentParser: " + name +
                                    " requires a value");
    }
    if (value.empty()) {
        throw std::invalid_argument("ArgumentParser: " + name +
                                    " requires a value");
    }
    return value;
}

void ArgumentParser::parseLogType(const std::string &value,
                                  ParsedArgs &args) const {
    std::string rest = value;
    size_t pos = 0;
    while ((pos = rest.find(',')) != std::string::npos) {
        args.logger_types.push_back(rest.substr(0, pos));
        rest.erase(0, pos + 1);
    }
    if (!rest.empty()) {
        args.logger_types.push_back(rest);
    }
}

void ArgumentParser::validateLogLevel(const std::string &level) const {
    if (std::find(validLogLevels.begin(), validLogLevels.end(), level) ==
        validLogLevels.end()) {
        throw std::invalid_argument("ArgumentParser: Invalid log level: " + level);
    }
}

void ArgumentParser::validateLogTypes(
    const std::vector<std::string> &types) const {
    for (const auto &type : types) {
        if (std::find(validLogTypes.begin(), validLogTypes.end(), type) ==
            validLogTypes.end()) {
            throw std::invalid_argument("ArgumentParser: Invalid logger type: " +
                                        type);
        }
    }
}

void ArgumentParser::printHelp(std::ostream &out) {
    out << "procguardd - single-instance service guard\n\n"
        << "Usage:\n"
        << " procguardd [options]\n\n"
        << "Options:\n"
        << " --help, -h          Show this help message\n"
        << " --version, -v       Show version info\n"
        << " --config-file=FILE  Configuration file path\n"
        << " --pidfile=FILE      PID file path (overrides configuration)\n"
        << " --daemon, -d        Detach from the terminal\n"
        << " --foreground, -f    Stay in the foreground\n"
        << " --log-type=TYPES    Logger types (comma-separated) [console|file]\n"
        << " --log-level=LEVEL   Logging level "
           "[debug|info|warning|error|critical]\n"
        << " --status            Report whether the service is running\n"
        << " --stop              Send SIGTERM to the running service\n";
}

}  // namespace procguard
