/**
 * @file test_sensor_snapshot.cpp
 * @brief Google Test suite for sensor snapshots and the reader that fills them
 */
#include <gtest/gtest.h>
#include <stdexcept>
#include "sensor_snapshot.hpp"
#include "tests/mocks/fake_chamber_io.hpp"

TEST(SensorSnapshotTest, GateLockedWithoutFeedbackMeansClosed) {
    EXPECT_TRUE(SensorSnapshot(false, true, false, std::nullopt, false).gateLocked());
    EXPECT_FALSE(SensorSnapshot(true, true, false, std::nullopt, false).gateLocked());
}

TEST(SensorSnapshotTest, GateLockedHonoursCoilFeedback) {
    EXPECT_TRUE(SensorSnapshot(false, true, false, LockState::Locked, false).gateLocked());
    EXPECT_FALSE(SensorSnapshot(false, true, false, LockState::Unlocked, false).gateLocked());
    EXPECT_FALSE(SensorSnapshot(true, true, false, LockState::Locked, false).gateLocked())
        << "An open gate is never locked";
}

TEST(SensorSnapshotTest, GateUnlocked) {
    EXPECT_TRUE(SensorSnapshot(true, false, true, std::nullopt, false).gateUnlocked());
    EXPECT_TRUE(SensorSnapshot(false, false, true, LockState::Unlocked, false).gateUnlocked());
    EXPECT_FALSE(SensorSnapshot(false, false, true, std::nullopt, false).gateUnlocked())
        << "Without feedback a closed gate cannot prove it is unlocked";
}

TEST(SensorSnapshotTest, PresenceIsAnyOf) {
    const SensorSnapshot none(false, false, false, std::nullopt, false, {false, false}, {});
    EXPECT_FALSE(none.productPresent());
    EXPECT_FALSE(none.saucePresent()) << "No sauce sensors reads as absent";

    const SensorSnapshot some(false, false, false, std::nullopt, false, {false, true}, {false, false, true});
    EXPECT_TRUE(some.productPresent());
    EXPECT_TRUE(some.saucePresent());
}

TEST(SensorReaderTest, RefreshReadsEverySignal) {
    FakeChamberIo io;
    io.chamberOpen = true;
    io.partitionUp = true;
    io.partitionDown = false;
    io.products = {true, false};
    SensorReader reader(io.sensorTable(), 2, 3);

    reader.refresh();
    const SensorSnapshot& s = reader.snapshot();
    EXPECT_TRUE(s.chamberOpen());
    EXPECT_TRUE(s.partitionUp());
    EXPECT_FALSE(s.partitionDown());
    EXPECT_FALSE(s.lockConfirmed().has_value());
    EXPECT_EQ(s.products().size(), 2);
    EXPECT_EQ(s.sauces().size(), 3);
    EXPECT_TRUE(s.productPresent());
    EXPECT_FALSE(reader.hasLockFeedback());
}

TEST(SensorReaderTest, LockFeedbackIsOptional) {
    FakeChamberIo io;
    io.lockFeedback = false;
    SensorReader reader(io.sensorTable(), 2, 0);

    reader.refresh();
    EXPECT_TRUE(reader.hasLockFeedback());
    ASSERT_TRUE(reader.snapshot().lockConfirmed().has_value());
    EXPECT_EQ(*reader.snapshot().lockConfirmed(), LockState::Unlocked);
}

TEST(SensorReaderTest, FailedRefreshKeepsPreviousSnapshot) {
    FakeChamberIo io;
    io.partitionUp = true;
    SensorReader reader(io.sensorTable(), 2, 0);
    reader.refresh();

    io.partitionUp = false;
    io.failReads = true;
    EXPECT_THROW(reader.refresh(), HardwareIoError);
    EXPECT_TRUE(reader.snapshot().partitionUp()) << "Partial reads must not leak into the snapshot";
}

TEST(SensorReaderTest, MissingMandatorySignalThrows) {
    FakeChamberIo io;
    SensorTable table = io.sensorTable();
    table.remove(SignalNames::MotorFault);
    EXPECT_THROW(SensorReader(table, 2, 0), std::invalid_argument);

    EXPECT_THROW(SensorReader(io.sensorTable(), 4, 0), std::invalid_argument)
        << "Only two product sensors are wired";
}
