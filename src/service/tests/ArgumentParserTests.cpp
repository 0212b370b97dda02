#include <gtest/gtest.h>

#include <sstream>

#include "ServiceTestHelpers.hpp"
#include "argumentparser.hpp"

using procguard::ArgumentParser;
using procguard_test::Argv;

TEST(ArgumentParserTest, DefaultsWithoutArguments) {
    Argv argv({});
    auto args = ArgumentParser().parse(argv.argc(), argv.argv());

    EXPECT_FALSE(args.config_path.has_value());
    EXPECT_FALSE(args.pidfile.has_value());
    EXPECT_FALSE(args.daemon_mode.has_value());
    EXPECT_FALSE(args.status);
    EXPECT_FALSE(args.stop);
    EXPECT_TRUE(args.logger_types.empty());
}

TEST(ArgumentParserTest, BothValueForms) {
    Argv argv({"--config-file=/etc/procguardd.json", "--pidfile", "/run/p.pid",
               "--log-level=debug", "--log-type", "console,file", "--daemon"});
    auto args = ArgumentParser().parse(argv.argc(), argv.argv());

    EXPECT_EQ(args.config_path, "/etc/procguardd.json");
    EXPECT_EQ(args.pidfile, "/run/p.pid");
    EXPECT_EQ(args.log_level, "debug");
    EXPECT_EQ(args.logger_types,
              (std::vector<std::string>{"console", "file"}));
    EXPECT_EQ(args.daemon_mode, true);
}

TEST(ArgumentParserTest, ForegroundFlag) {
    Argv argv({"-f", "--status"});
    auto args = ArgumentParser().parse(argv.argc(), argv.argv());
    EXPECT_EQ(args.daemon_mode, false);
    EXPECT_TRUE(args.status);
}

TEST(ArgumentParserTest, RejectsInvalidInput) {
    ArgumentParser parser;
    {
        Argv argv({"--bogus"});
        EXPECT_THROW(parser.parse(argv.argc(), argv.argv()), std::invalid_argument);
    }
    {
        Argv argv({"--pidfile"});
        EXPECT_THROW(parser.parse(argv.argc(), argv.argv()), std::invalid_argument);
    }
    {
        Argv argv({"--log-level=verbose"});
        EXPECT_THROW(parser.parse(argv.argc(), argv.argv()), std::invalid_argument);
    }
    {
        Argv argv({"--log-type=syslog"});
        EXPECT_THROW(parser.parse(argv.argc(), argv.argv()), std::invalid_argument);
    }
    {
        Argv argv({"--daemon", "--foreground"});
        EXPECT_THROW(parser.parse(argv.argc(), argv.argv()), std::invalid_argument);
    }
    {
        Argv argv({"--status", "--stop"});
        EXPECT_THROW(parser.parse(argv.argc(), argv.argv()), std::invalid_argument);
    }
}

TEST(ArgumentParserTest, HelpListsOptions) {
    std::ostringstream out;
    ArgumentParser::printHelp(out);
    EXPECT_NE(out.str().find("--pidfile"), std::string::npos);
    EXPECT_NE(out.str().find("--stop"), std::string::npos);
}
