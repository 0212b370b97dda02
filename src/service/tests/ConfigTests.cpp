#include <gtest/gtest.h>
#include <stdlib.h>

#include <nlohmann/json.hpp>

#include "ServiceTestHelpers.hpp"
#include "configloader.hpp"
#include "configvalidator.hpp"
#include "environmentprocessor.hpp"
#include "servicesettings.hpp"

using namespace procguard;
using procguard_test::TempDir;

namespace {

nlohmann::json fullConfig() {
    return R"({
      "pidfile": {"path": "/run/procguardd.pid", "auto_remove": false},
      "lock": {"directory": "/tmp/locks", "start_delay": 0.5,
               "delay_increase": 0, "max_delay": 2, "max_age": null,
               "use_pid": false, "timeout": 3},
      "daemon": {"enabled": true, "workdir": "/srv", "umask": "027",
                 "stdout": "/var/log/out.log", "stderr": "inherit",
                 "user": "nobody", "group": "nogroup"},
      "locks": [{"resource": "spool", "path": "spool.lock"}],
      "logging": [{"type": "file", "level": "debug", "file": "/var/log/p.log"}],
      "recheck_interval": 2.5
    })"_json;
}

}  // namespace

TEST(ConfigLoaderTest, LoadsAndReloadsFile) {
    TempDir dir;
    const auto path = dir.path() / "config.json";
    procguard_test::writeFile(path, R"({"pidfile": {"path": "a.pid"}})");

    ConfigLoader loader;
    EXPECT_FALSE(loader.hasLoadedFile());
    auto config = loader.loadFromFile(path.string());
    EXPECT_EQ(config["pidfile"]["path"], "a.pid");
    EXPECT_EQ(loader.getLastLoadedFile(), path.string());

    procguard_test::writeFile(path, R"({"pidfile": {"path": "b.pid"}})");
    EXPECT_EQ(loader.reload()["pidfile"]["path"], "b.pid");
}

TEST(ConfigLoaderTest, ReportsErrors) {
    TempDir dir;
    ConfigLoader loader;
    EXPECT_THROW(loader.loadFromFile(""), std::invalid_argument);
    EXPECT_THROW(loader.loadFromFile((dir.path() / "missing.json").string()),
                 std::runtime_error);
    EXPECT_THROW(loader.reload(), std::runtime_error);

    const auto path = dir.path() / "broken.json";
    procguard_test::writeFile(path, "{\"pidfile\": ");
    EXPECT_THROW(loader.loadFromFile(path.string()), std::runtime_error);
}

TEST(EnvironmentProcessorTest, SubstitutesNestedStrings) {
    ::setenv("PROCGUARD_TEST_RUN", "/run/test", 1);
    ::unsetenv("PROCGUARD_TEST_UNSET");

    auto config = R"({
      "pidfile": {"path": "$ENV{PROCGUARD_TEST_RUN}/p.pid"},
      "locks": [{"resource": "x", "path": "$ENV{PROCGUARD_TEST_UNSET}/x"}],
      "recheck_interval": 3
    })"_json;
    EnvironmentProcessor().process(config);

    EXPECT_EQ(config["pidfile"]["path"], "/run/test/p.pid");
    EXPECT_EQ(config["locks"][0]["path"], "$ENV{PROCGUARD_TEST_UNSET}/x");
    EXPECT_EQ(config["recheck_interval"], 3);
}

TEST(ConfigValidatorTest, AcceptsFullConfig) {
    EXPECT_NO_THROW(ConfigValidator().validate(fullConfig()));
}

TEST(ConfigValidatorTest, RejectsStructuralErrors) {
    ConfigValidator validator;

    EXPECT_THROW(validator.validate(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(validator.validate(R"({"lock": {}})"_json), std::runtime_error);

    auto config = fullConfig();
    config["pidfile"]["path"] = "";
    EXPECT_THROW(validator.validate(config), std::runtime_error);

    config = fullConfig();
    config["lock"]["start_delay"] = "fast";
    EXPECT_THROW(validator.validate(config), std::runtime_error);

    config = fullConfig();
    config["locks"][0].erase("resource");
    EXPECT_THROW(validator.validate(config), std::runtime_error);

    config = fullConfig();
    config["logging"] = R"([{"type": "file"}])"_json;
    EXPECT_THROW(validator.validate(config), std::runtime_error);

    config = fullConfig();
    config["recheck_interval"] = 0;
    EXPECT_THROW(validator.validate(config), std::runtime_error);
}

TEST(ConfigValidatorTest, MissingSectionMessage) {
    try {
        ConfigValidator().validate(nlohmann::json::object());
        FAIL() << "runtime_error expected";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(),
                     "ConfigValidator: Missing required section: pidfile");
    }
}

TEST(ServiceSettingsTest, FromJson) {
    auto settings = ServiceSettings::fromJson(fullConfig());
    const auto& guard = settings.guard;

    EXPECT_EQ(guard.pidfile, "/run/procguardd.pid");
    EXPECT_FALSE(guard.pidfile_auto_remove);
    EXPECT_EQ(guard.lock_dir, "/tmp/locks");
    EXPECT_DOUBLE_EQ(guard.retry.start_delay.count(), 0.5);
    EXPECT_DOUBLE_EQ(guard.retry.delay_increase.count(), 0.0);
    EXPECT_DOUBLE_EQ(guard.retry.max_delay.count(), 2.0);
    EXPECT_FALSE(guard.retry.max_age.has_value());
    EXPECT_FALSE(guard.retry.use_pid);
    EXPECT_DOUBLE_EQ(guard.lock_timeout.count(), 3.0);

    EXPECT_TRUE(guard.daemonize);
    EXPECT_EQ(guard.daemon.workdir, "/srv");
    EXPECT_EQ(guard.daemon.umask, 027u);
    EXPECT_EQ(guard.daemon.stdout_target.kind, RedirectKind::File);
    EXPECT_EQ(guard.daemon.stdout_target.path, "/var/log/out.log");
    EXPECT_EQ(guard.daemon.stderr_target.kind, RedirectKind::Inherit);
    EXPECT_EQ(guard.daemon.user, "nobody");
    EXPECT_EQ(guard.daemon.group, "nogroup");

    ASSERT_EQ(guard.locks.size(), 1u);
    EXPECT_EQ(guard.locks[0].resource_id, "spool");
    EXPECT_EQ(guard.locks[0].path, "spool.lock");

    ASSERT_EQ(settings.loggers.size(), 1u);
    EXPECT_EQ(settings.loggers[0].type, "file");
    EXPECT_EQ(settings.loggers[0].file, "/var/log/p.log");
    EXPECT_DOUBLE_EQ(settings.recheck_interval.count(), 2.5);
}

TEST(ServiceSettingsTest, MinimalConfigKeepsDefaults) {
    auto settings =
        ServiceSettings::fromJson(R"({"pidfile": {"path": "x.pid"}})"_json);

    EXPECT_TRUE(settings.guard.pidfile_auto_remove);
    EXPECT_FALSE(settings.guard.daemonize);
    EXPECT_EQ(settings.guard.lock_dir, "/var/lock");
    ASSERT_TRUE(settings.guard.retry.max_age.has_value());
    EXPECT_DOUBLE_EQ(settings.guard.retry.max_age->count(), 300.0);
    ASSERT_EQ(settings.loggers.size(), 1u);
    EXPECT_EQ(settings.loggers[0].type, "console");
}

TEST(ServiceSettingsTest, RejectsInvalidValues) {
    auto config = fullConfig();
    config["lock"]["max_delay"] = 0;
    EXPECT_THROW(ServiceSettings::fromJson(config), std::invalid_argument);

    config = fullConfig();
    config["daemon"]["umask"] = "089";
    EXPECT_THROW(ServiceSettings::fromJson(config), std::invalid_argument);

    config = fullConfig();
    config["logging"][0]["level"] = "loud";
    EXPECT_THROW(ServiceSettings::fromJson(config), std::invalid_argument);
}

TEST(ServiceSettingsTest, CommandLineOverrides) {
    auto settings = ServiceSettings::fromJson(fullConfig());

    ParsedArgs args;
    args.pidfile = "/tmp/other.pid";
    args.daemon_mode = false;
    args.logger_types = {"console", "file"};
    args.log_level = "error";
    settings.applyArguments(args);

    EXPECT_EQ(settings.guard.pidfile, "/tmp/other.pid");
    EXPECT_FALSE(settings.guard.daemonize);
    ASSERT_EQ(settings.loggers.size(), 2u);
    EXPECT_EQ(settings.loggers[0].type, "console");
    EXPECT_EQ(settings.loggers[1].file, "/var/log/p.log");
    EXPECT_EQ(settings.loggers[0].level, "error");
    EXPECT_EQ(settings.loggers[1].level, "error");
}

TEST(ServiceSettingsTest, ParseUmask) {
    EXPECT_EQ(parseUmask(nlohmann::json("022")), 022u);
    EXPECT_EQ(parseUmask(nlohmann::json(18u)), 022u);
    EXPECT_THROW(parseUmask(nlohmann::json("abc")), std::invalid_argument);
    EXPECT_THROW(parseUmask(nlohmann::json("1000")), std::invalid_argument);
    EXPECT_THROW(parseUmask(nlohmann::json(-1)), std::invalid_argument);
}
