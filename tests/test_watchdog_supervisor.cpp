/**
 * @file test_watchdog_supervisor.cpp
 * @brief Google Test suite for the confirmation watchdog registry
 */
#include <gtest/gtest.h>
#include <limits>
#include <stdexcept>
#include "watchdog_supervisor.hpp"
#include "tests/mocks/manual_clock.hpp"

class WatchdogSupervisorTest : public ::testing::Test {
protected:
    ManualClock clock;
    WatchdogSupervisor supervisor{clock};
};

TEST_F(WatchdogSupervisorTest, FiresOnceAtDeadline) {
    int fired = 0;
    int signalled = 0;
    QObject::connect(&supervisor, &WatchdogSupervisor::expired,
                     [&signalled](WatchdogHandle, const QString&, const QVariantMap&) { ++signalled; });

    supervisor.registerCheck([] { return false; }, 2.0, "never confirmed",
                             [&fired](const WatchdogEntry&) { ++fired; });

    supervisor.evaluate(1999);
    EXPECT_EQ(fired, 0) << "Must not fire before the deadline";
    EXPECT_EQ(supervisor.size(), 1);

    supervisor.evaluate(2000);
    EXPECT_EQ(fired, 1) << "Must fire at t >= 2.0 s";
    EXPECT_EQ(signalled, 1);
    EXPECT_TRUE(supervisor.isEmpty()) << "Fired entry must be dropped";

    supervisor.evaluate(5000);
    EXPECT_EQ(fired, 1) << "Fired entry must never come back";
}

TEST_F(WatchdogSupervisorTest, SatisfiedPredicateDropsSilently) {
    bool confirmed = false;
    int fired = 0;
    supervisor.registerCheck([&confirmed] { return confirmed; }, 1.0, "partition up",
                             [&fired](const WatchdogEntry&) { ++fired; });

    supervisor.evaluate(500);
    EXPECT_EQ(supervisor.size(), 1);

    confirmed = true;
    supervisor.evaluate(600);
    EXPECT_TRUE(supervisor.isEmpty());

    supervisor.evaluate(5000);
    EXPECT_EQ(fired, 0) << "Confirmed check must not time out later";
}

TEST_F(WatchdogSupervisorTest, SatisfiedAfterDeadlineCountsAsConfirmed) {
    int fired = 0;
    supervisor.registerCheck([] { return true; }, 1.0, "late but true",
                             [&fired](const WatchdogEntry&) { ++fired; });

    supervisor.evaluate(10000);
    EXPECT_EQ(fired, 0) << "Predicate is checked before the deadline";
    EXPECT_TRUE(supervisor.isEmpty());
}

TEST_F(WatchdogSupervisorTest, DuplicateRegistrationsAreIndependent) {
    int fired = 0;
    auto onTimeout = [&fired](const WatchdogEntry&) { ++fired; };
    const WatchdogHandle a = supervisor.registerCheck([] { return false; }, 1.0, "gate locked", onTimeout);
    const WatchdogHandle b = supervisor.registerCheck([] { return false; }, 1.0, "gate locked", onTimeout);

    EXPECT_NE(a, b);
    EXPECT_EQ(supervisor.size(), 2) << "Identical checks are not merged";

    supervisor.evaluate(1000);
    EXPECT_EQ(fired, 2);
}

TEST_F(WatchdogSupervisorTest, DeadlineIsRelativeToRegistrationTime) {
    clock.set(5000);
    supervisor.registerCheck([] { return false; }, 2.0, "late registration");

    supervisor.evaluate(6999);
    EXPECT_EQ(supervisor.size(), 1);
    EXPECT_EQ(supervisor.entries().first().deadlineMs, 7000);
    EXPECT_EQ(supervisor.entries().first().createdAtMs, 5000);

    supervisor.evaluate(7000);
    EXPECT_TRUE(supervisor.isEmpty());
}

TEST_F(WatchdogSupervisorTest, CancelRemovesEntry) {
    const WatchdogHandle id = supervisor.registerCheck([] { return false; }, 1.0, "cancelled");
    EXPECT_TRUE(supervisor.cancel(id));
    EXPECT_FALSE(supervisor.cancel(id)) << "Second cancel finds nothing";

    int signalled = 0;
    QObject::connect(&supervisor, &WatchdogSupervisor::expired,
                     [&signalled](WatchdogHandle, const QString&, const QVariantMap&) { ++signalled; });
    supervisor.evaluate(5000);
    EXPECT_EQ(signalled, 0);
}

TEST_F(WatchdogSupervisorTest, ThrowingPredicateIsDroppedWithoutAffectingOthers) {
    int fired = 0;
    supervisor.registerCheck([]() -> bool { throw std::runtime_error("sensor gone"); }, 1.0, "broken");
    supervisor.registerCheck([] { return false; }, 1.0, "healthy",
                             [&fired](const WatchdogEntry&) { ++fired; });

    EXPECT_NO_THROW(supervisor.evaluate(100));
    EXPECT_EQ(supervisor.size(), 1) << "Only the broken entry is dropped";

    supervisor.evaluate(1000);
    EXPECT_EQ(fired, 1);
}

TEST_F(WatchdogSupervisorTest, NonStandardExceptionIsContained) {
    supervisor.registerCheck([]() -> bool { throw 7; }, 1.0, "odd failure");

    EXPECT_NO_THROW(supervisor.evaluate(100));
    EXPECT_TRUE(supervisor.isEmpty());
}

TEST_F(WatchdogSupervisorTest, VeryLongTimeoutDoesNotWrap) {
    clock.set(1000);
    int fired = 0;
    supervisor.registerCheck([] { return false; }, 3000000.0, "month-long wait",
                             [&fired](const WatchdogEntry&) { ++fired; });

    EXPECT_EQ(supervisor.entries().first().deadlineMs, 1000 + 3000000000LL);
    supervisor.evaluate(1000);
    supervisor.evaluate(2000000000LL);
    EXPECT_EQ(fired, 0);

    supervisor.evaluate(1000 + 3000000000LL);
    EXPECT_EQ(fired, 1);
}

TEST_F(WatchdogSupervisorTest, AbsurdTimeoutNeverFires) {
    int fired = 0;
    supervisor.registerCheck([] { return false; }, 1e300, "effectively forever",
                             [&fired](const WatchdogEntry&) { ++fired; });

    EXPECT_GT(supervisor.entries().first().deadlineMs, 0);
    supervisor.evaluate(std::numeric_limits<qint64>::max() / 8);
    EXPECT_EQ(fired, 0);
}

TEST_F(WatchdogSupervisorTest, MetadataTravelsWithExpiry) {
    QVariantMap metadata;
    metadata.insert("device", "chamber_1");
    metadata.insert("confirmation", "gate_locked_confirmed");

    QVariantMap seen;
    QString description;
    QObject::connect(&supervisor, &WatchdogSupervisor::expired,
                     [&](WatchdogHandle, const QString& d, const QVariantMap& m) { description = d; seen = m; });

    supervisor.registerCheck([] { return false; }, 0.5, "gate not locked", nullptr, metadata);
    supervisor.evaluate(500);

    EXPECT_EQ(description, QString("gate not locked"));
    EXPECT_EQ(seen.value("device").toString(), QString("chamber_1"));
    EXPECT_EQ(seen.value("confirmation").toString(), QString("gate_locked_confirmed"));
}
