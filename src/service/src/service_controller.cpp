/**
 * @file service_controller.cpp
 * @brief Реализация методов ServiceController
 *
 * @author procguard Development Team
 * @date Октябрь 2026
 * @version 1.0
 * @license MIT
 */

#include "service_controller.hpp"

#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

#include "configloader.hpp"
#include "configvalidator.hpp"
#include "environmentprocessor.hpp"
#include "exitcodes.hpp"
#include "loggingeventsink.hpp"
#include "procguard/Errors.hpp"
#include "procguard/PidFile.hpp"
#include "procguard/ServiceGuard.hpp"
#include "procguard/SignalRouter.hpp"
#include "procguard/consolelogger.hpp"

namespace procguard {

ServiceController::ServiceController(std::ostream &out, std::ostream &err)
    : out_(out), err_(err) {}

int ServiceController::run(int argc, char **argv) {
    ParsedArgs args;
    try {
        ArgumentParser parser;
        args = parser.parse(argc, argv);
    } catch (const std::invalid_argument &e) {
        err_ << e.what() << '\n';
        ArgumentParser::printHelp(err_);
        return EXIT_USAGE;
    }

    if (args.help_message) {
        ArgumentParser::printHelp(out_);
        return EXIT_OK;
    }
    if (args.version_message) {
        printVersion();
        return EXIT_OK;
    }

    ServiceSettings settings;
    try {
        settings = loadSettings(args);
    } catch (const std::exception &e) {
        err_ << "procguardd: configuration error: " << e.what() << '\n';
        return EXIT_USAGE;
    }

    if (args.status) return reportStatus(settings);
    if (args.stop) return stopRunning(settings);
    return serve(settings);
}

ServiceSettings ServiceController::loadSettings(const ParsedArgs &args) const {
    ServiceSettings settings;
    if (args.config_path) {
        ConfigLoader loader;
        nlohmann::json config = loader.loadFromFile(*args.config_path);
        EnvironmentProcessor().process(config);
        ConfigValidator().validate(config);
        settings = ServiceSettings::fromJson(config);
    } else {
        settings = ServiceSettings::defaults();
    }
    settings.applyArguments(args);
    return settings;
}

void ServiceController::initLogger(const ServiceSettings &settings) {
    logger_ = std::make_shared<CompositeLogger>();
    fileLoggers_.clear();
    hasConsole_ = false;

    for (const auto &entry : settings.loggers) {
        const LogLevel level = stringToLogLevel(entry.level);
        if (entry.type == "file") {
            auto logger = std::make_shared<FileLogger>(entry.file);
            logger->init(level);
            fileLoggers_.push_back(logger);
            logger_->addLogger(logger);
        } else {
            auto logger = std::make_shared<ConsoleLogger>(std::cerr,
                                                          ::isatty(STDERR_FILENO));
            logger->init(level);
            logger_->addLogger(logger);
            hasConsole_ = true;
        }
    }
}

void ServiceController::reopenFileLoggers() {
    for (auto &logger : fileLoggers_) {
        logger->reopen();
    }
}

int ServiceController::reportStatus(const ServiceSettings &settings) {
    try {
        PidFile pidfile(settings.guard.pidfile);
        const PidFileStatus status = pidfile.check();
        switch (status.state) {
            case PidFileState::ValidOwnedByOther:
            case PidFileState::ValidOwnedByUs:
                out_ << "procguardd is running (pid " << status.pid << ")\n";
                return EXIT_OK;
            case PidFileState::Stale:
                out_ << "procguardd is not running (stale PID file "
                     << pidfile.path().string() << ")\n";
                return 1;
            case PidFileState::Absent:
                out_ << "procguardd is not running\n";
                return 1;
        }
    } catch (const std::exception &e) {
        err_ << "procguardd: " << e.what() << '\n';
        return exitCodeFor(std::current_exception());
    }
    return 1;
}

int ServiceController::stopRunning(const ServiceSettings &settings) {
    try {
        PidFile pidfile(settings.guard.pidfile);
        const PidFileStatus status = pidfile.check();
        if (status.state != PidFileState::ValidOwnedByOther) {
            out_ << "procguardd is not running\n";
            return 1;
        }
        if (::kill(status.pid, SIGTERM) != 0) {
            throw std::system_error(errno, std::system_category(),
                                    "Cannot send SIGTERM to process " +
                                        std::to_string(status.pid));
        }
        out_ << "SIGTERM sent to procguardd (pid " << status.pid << ")\n";
        return EXIT_OK;
    } catch (const std::exception &e) {
        err_ << "procguardd: " << e.what() << '\n';
        return exitCodeFor(std::current_exception());
    }
}

int ServiceController::serve(const ServiceSettings &settings) {
    try {
        initLogger(settings);
    } catch (const std::exception &e) {
        err_ << "procguardd: logger setup failed: " << e.what() << '\n';
        return EXIT_USAGE;
    }

    EventSink sink = LoggingEventSink(logger_, [this] { reopenFileLoggers(); });

    try {
        ServiceGuard guard(settings.guard, sink);
        logger_->flush();

        const RunningService service = guard.start();
        logger_->info("procguardd started (pid " + std::to_string(service.pid) +
                      (service.daemonized ? ", daemon" : ", foreground") + ")");

        const int signum = guard.waitForShutdown(settings.recheck_interval);
        if (signum != 0) {
            logger_->info("Shutdown requested by SIG" + signalName(signum));
        } else {
            logger_->info("Shutdown requested");
        }

        guard.stop();
        const bool failed = guard.failed();
        logger_->info(failed ? "procguardd stopped with errors"
                             : "procguardd stopped");
        logger_->flush();
        return failed ? EXIT_OTHER_FAILURE : EXIT_OK;
    } catch (const std::exception &e) {
        logger_->critical(e.what());
        logger_->flush();
        // до отсоединения терминал ещё доступен
        if (!hasConsole_) err_ << "procguardd: " << e.what() << '\n';
        return exitCodeFor(std::current_exception());
    }
}

void ServiceController::printVersion() {
    out_ << "procguardd v1.0.0\n";
}

}  // namespace procguard
