#include <gtest/gtest.h>

#include "procguard/Errors.hpp"
#include "procguard/Events.hpp"

TEST(EventsTest, DescribesTakeover) {
    procguard::ProcessEvent event{procguard::EventKind::LockStaleTakeover,
                                  "/tmp/x.lock", 10, 20, {}, "owner is dead"};
    EXPECT_EQ(procguard::describeEvent(event),
              "Stale lock /tmp/x.lock of PID 20 taken over by PID 10: owner is dead");
}

TEST(EventsTest, EmptySinkIsAllowed) {
    procguard::EventSink sink;
    EXPECT_NO_THROW(procguard::emitEvent(
        sink, {procguard::EventKind::ServiceStopping, "", 1, 0, {}, ""}));
}

TEST(EventsTest, KindNames) {
    EXPECT_STREQ(procguard::eventKindName(procguard::EventKind::DaemonDetached),
                 "DaemonDetached");
}

TEST(ErrorsTest, CarryPathPidAndCode) {
    procguard::PidFileInUseError inUse("/run/x.pid", 42);
    EXPECT_EQ(inUse.pid(), 42);
    EXPECT_EQ(inUse.path(), "/run/x.pid");
    EXPECT_NE(std::string(inUse.what()).find("42"), std::string::npos);

    procguard::DaemonizeError fork(procguard::DaemonizeStage::Fork, "fork()",
                                   std::error_code(EAGAIN, std::system_category()));
    EXPECT_EQ(fork.stage(), procguard::DaemonizeStage::Fork);
    EXPECT_EQ(fork.code().value(), EAGAIN);

    // вся иерархия ловится через базовый класс
    EXPECT_THROW(throw procguard::LockIOError("x", "/p"), procguard::ProcessGuardError);
    EXPECT_THROW(throw procguard::InvalidPidFileError("/p", "bad"),
                 procguard::PidFileError);
}
