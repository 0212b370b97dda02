#include <fcntl.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "MockSystemCalls.hpp"
#include "procguard/Daemonizer.hpp"
#include "procguard/Errors.hpp"

using namespace testing;

namespace {

constexpr int kNullFd = 10;

}  // namespace

class DaemonizerTest : public Test {
protected:
    void SetUp() override {
        settings_.workdir = "/srv/app";
        settings_.umask = 027;
        ON_CALL(*sys_, open(StrEq("/dev/null"), _, _)).WillByDefault(Return(kNullFd));
        ON_CALL(*sys_, dup2(_, _)).WillByDefault(ReturnArg<1>());
        ON_CALL(*sys_, exitProcess(_)).WillByDefault(Invoke([](int status) {
            throw ParentExited{status};
        }));
    }

    procguard::EventSink sink() {
        return [this](const procguard::ProcessEvent& e) { events_.push_back(e); };
    }

    procguard::DaemonSettings settings_;
    std::shared_ptr<NiceMock<MockSystemCalls>> sys_ =
        std::make_shared<NiceMock<MockSystemCalls>>();
    std::vector<procguard::ProcessEvent> events_;
};

TEST_F(DaemonizerTest, DaemonizeSuccessFlow) {
    InSequence seq;
    EXPECT_CALL(*sys_, getpid()).WillOnce(Return(100));
    EXPECT_CALL(*sys_, open(StrEq("/dev/null"), _, _)).WillOnce(Return(kNullFd));
    EXPECT_CALL(*sys_, fork()).WillOnce(Return(0));
    EXPECT_CALL(*sys_, setsid()).WillOnce(Return(200));
    EXPECT_CALL(*sys_, fork()).WillOnce(Return(0));
    EXPECT_CALL(*sys_, chdir(StrEq("/srv/app"))).WillOnce(Return(0));
    EXPECT_CALL(*sys_, umask(027)).WillOnce(Return(022));
    EXPECT_CALL(*sys_, dup2(kNullFd, 0)).WillOnce(Return(0));
    EXPECT_CALL(*sys_, dup2(kNullFd, 1)).WillOnce(Return(1));
    EXPECT_CALL(*sys_, dup2(kNullFd, 2)).WillOnce(Return(2));
    EXPECT_CALL(*sys_, close(kNullFd)).WillOnce(Return(0));
    EXPECT_CALL(*sys_, closeFrom(3));
    EXPECT_CALL(*sys_, getpid()).WillOnce(Return(300));

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::Foreground);

    auto result = daemonizer.daemonize();

    EXPECT_EQ(result.original_pid, 100);
    EXPECT_EQ(result.daemon_pid, 300);
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::Detached);
    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].kind, procguard::EventKind::DaemonDetached);
    EXPECT_EQ(events_[0].other_pid, 100);
}

TEST_F(DaemonizerTest, ParentExitsWithZeroAfterFirstFork) {
    EXPECT_CALL(*sys_, fork()).WillOnce(Return(1234));
    EXPECT_CALL(*sys_, setsid()).Times(0);

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "parent must exit";
    } catch (const ParentExited& e) {
        EXPECT_EQ(e.status, 0);
    }
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::Foreground);
}

TEST_F(DaemonizerTest, SessionLeaderExitsAfterSecondFork) {
    EXPECT_CALL(*sys_, fork()).WillOnce(Return(0)).WillOnce(Return(4321));
    EXPECT_CALL(*sys_, setsid()).WillOnce(Return(1));
    EXPECT_CALL(*sys_, chdir(_)).Times(0);

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    EXPECT_THROW(daemonizer.daemonize(), ParentExited);
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::SessionLeader);
}

TEST_F(DaemonizerTest, FirstForkFailure) {
    EXPECT_CALL(*sys_, fork()).WillOnce(SetErrnoAndReturn(EAGAIN, -1));
    EXPECT_CALL(*sys_, close(kNullFd)).WillOnce(Return(0));
    EXPECT_CALL(*sys_, exitProcess(_)).Times(0);

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::Fork);
        EXPECT_EQ(e.code().value(), EAGAIN);
    }
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::Foreground);
    EXPECT_TRUE(events_.empty());
}

TEST_F(DaemonizerTest, SetsidFailure) {
    EXPECT_CALL(*sys_, fork()).WillOnce(Return(0));
    EXPECT_CALL(*sys_, setsid()).WillOnce(SetErrnoAndReturn(EPERM, -1));

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::Session);
        EXPECT_EQ(e.code().value(), EPERM);
    }
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::Forked);
}

TEST_F(DaemonizerTest, SecondForkFailure) {
    EXPECT_CALL(*sys_, fork()).WillOnce(Return(0)).WillOnce(
        SetErrnoAndReturn(ENOMEM, -1));
    EXPECT_CALL(*sys_, setsid()).WillOnce(Return(1));

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::SecondFork);
    }
}

TEST_F(DaemonizerTest, ChdirFailure) {
    EXPECT_CALL(*sys_, fork()).WillRepeatedly(Return(0));
    EXPECT_CALL(*sys_, setsid()).WillOnce(Return(1));
    EXPECT_CALL(*sys_, chdir(StrEq("/srv/app")))
        .WillOnce(SetErrnoAndReturn(ENOENT, -1));
    EXPECT_CALL(*sys_, dup2(_, _)).Times(0);

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::Chdir);
        EXPECT_EQ(e.path(), "/srv/app");
    }
}

TEST_F(DaemonizerTest, RedirectsToFileAndKeepsInheritedStderr) {
    settings_.stdout_target = procguard::RedirectTarget::file("/var/log/app.out");
    settings_.stderr_target = procguard::RedirectTarget::inherit();

    EXPECT_CALL(*sys_, open(StrEq("/var/log/app.out"), _, 0644))
        .WillOnce(Return(11));
    EXPECT_CALL(*sys_, fork()).WillRepeatedly(Return(0));
    EXPECT_CALL(*sys_, dup2(kNullFd, 0)).WillOnce(Return(0));
    EXPECT_CALL(*sys_, dup2(11, 1)).WillOnce(Return(1));
    EXPECT_CALL(*sys_, dup2(_, 2)).Times(0);
    EXPECT_CALL(*sys_, close(11)).WillOnce(Return(0));
    EXPECT_CALL(*sys_, close(kNullFd)).WillOnce(Return(0));

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    daemonizer.daemonize();
    EXPECT_EQ(daemonizer.phase(), procguard::DaemonPhase::Detached);
}

TEST_F(DaemonizerTest, UnopenableRedirectFailsBeforeFork) {
    settings_.stderr_target = procguard::RedirectTarget::file("/missing/app.err");

    EXPECT_CALL(*sys_, open(StrEq("/missing/app.err"), _, _))
        .WillOnce(SetErrnoAndReturn(ENOENT, -1));
    EXPECT_CALL(*sys_, close(kNullFd)).WillOnce(Return(0));
    EXPECT_CALL(*sys_, fork()).Times(0);

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::Prepare);
        EXPECT_EQ(e.path(), "/missing/app.err");
        EXPECT_EQ(e.code().value(), ENOENT);
    }
}

TEST_F(DaemonizerTest, UnknownUserFailsBeforeFork) {
    settings_.user = "procguard-no-such-user";
    EXPECT_CALL(*sys_, fork()).Times(0);

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::Prepare);
    }
}

TEST_F(DaemonizerTest, OutOfRangeNumericIdsFailBeforeFork) {
    EXPECT_CALL(*sys_, fork()).Times(0);

    const std::vector<std::pair<std::string, std::string>> cases = {
        {"99999999999999999999", ""},
        {"4294967296", ""},
        {"", "99999999999999999999"},
        {"", "4294967295"},
    };
    for (const auto& ids : cases) {
        settings_.user = ids.first;
        settings_.group = ids.second;
        procguard::Daemonizer daemonizer(settings_, sink(), sys_);
        try {
            daemonizer.daemonize();
            FAIL() << "DaemonizeError expected for '" << ids.first << "' / '"
                   << ids.second << "'";
        } catch (const procguard::DaemonizeError& e) {
            EXPECT_EQ(e.stage(), procguard::DaemonizeStage::Prepare);
            EXPECT_NE(std::string(e.what()).find("invalid"), std::string::npos);
        }
    }
}

TEST_F(DaemonizerTest, SwitchesUserAfterDetaching) {
    settings_.user = "root";

    EXPECT_CALL(*sys_, fork()).WillRepeatedly(Return(0));
    {
        InSequence seq;
        EXPECT_CALL(*sys_, closeFrom(3));
        EXPECT_CALL(*sys_, setgid(0)).WillOnce(Return(0));
        EXPECT_CALL(*sys_, initgroups(StrEq("root"), 0)).WillOnce(Return(0));
        EXPECT_CALL(*sys_, setuid(0)).WillOnce(Return(0));
    }

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    daemonizer.daemonize();
}

TEST_F(DaemonizerTest, SetuidFailure) {
    settings_.user = "0";

    EXPECT_CALL(*sys_, fork()).WillRepeatedly(Return(0));
    EXPECT_CALL(*sys_, setuid(0)).WillOnce(SetErrnoAndReturn(EPERM, -1));

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    try {
        daemonizer.daemonize();
        FAIL() << "DaemonizeError expected";
    } catch (const procguard::DaemonizeError& e) {
        EXPECT_EQ(e.stage(), procguard::DaemonizeStage::SwitchUser);
    }
    EXPECT_NE(daemonizer.phase(), procguard::DaemonPhase::Detached);
}

TEST_F(DaemonizerTest, SecondCallIsRejected) {
    EXPECT_CALL(*sys_, fork()).WillRepeatedly(Return(0));

    procguard::Daemonizer daemonizer(settings_, sink(), sys_);
    daemonizer.daemonize();
    EXPECT_THROW(daemonizer.daemonize(), std::logic_error);
}

TEST(PosixSystemCallsTest, CloseFromClosesOnlyHighDescriptors) {
    pid_t child = ::fork();
    ASSERT_GE(child, 0);
    if (child == 0) {
        int low = ::open("/dev/null", O_RDONLY);
        int high = ::open("/dev/null", O_RDONLY);
        if (low < 0 || high < 0 || ::dup2(high, 200) != 200) ::_exit(10);

        procguard::PosixSystemCalls sys;
        sys.closeFrom(high);

        if (::fcntl(low, F_GETFD) == -1) ::_exit(11);
        if (::fcntl(high, F_GETFD) != -1 || errno != EBADF) ::_exit(12);
        if (::fcntl(200, F_GETFD) != -1 || errno != EBADF) ::_exit(13);
        ::_exit(0);
    }

    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, 0), child);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 0);
}

TEST(RedirectTargetTest, ParsesConfigValues) {
    EXPECT_EQ(procguard::RedirectTarget::parse("").kind,
              procguard::RedirectKind::Discard);
    EXPECT_EQ(procguard::RedirectTarget::parse("/dev/null").kind,
              procguard::RedirectKind::Discard);
    EXPECT_EQ(procguard::RedirectTarget::parse("inherit").kind,
              procguard::RedirectKind::Inherit);
    auto file = procguard::RedirectTarget::parse("/var/log/x.log");
    EXPECT_EQ(file.kind, procguard::RedirectKind::File);
    EXPECT_EQ(file.path, "/var/log/x.log");
}
