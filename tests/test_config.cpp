/**
 * @file test_config.cpp
 * @brief Google Test suite for chamber configuration loading
 */
#include <gtest/gtest.h>
#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <limits>
#include "config.hpp"

namespace {

QJsonObject parse(const char* text) {
    return QJsonDocument::fromJson(QByteArray(text)).object();
}

}  // namespace

TEST(TimeoutConfigTest, Defaults) {
    const TimeoutConfig t;
    EXPECT_DOUBLE_EQ(t.seconds(Confirmation::PartitionOpenReached), 10.0);
    EXPECT_DOUBLE_EQ(t.seconds(Confirmation::PartitionCloseReached), 10.0);
    EXPECT_DOUBLE_EQ(t.seconds(Confirmation::GateLockedConfirmed), 2.0);
    EXPECT_DOUBLE_EQ(t.seconds(Confirmation::GateUnlockedConfirmed), 2.0);
    EXPECT_DOUBLE_EQ(t.seconds(Confirmation::GateClosedConfirmed), 180.0);
}

TEST(TimeoutConfigTest, RejectsNonPositiveAndNonFinite) {
    TimeoutConfig t;
    EXPECT_FALSE(t.set(Confirmation::GateLockedConfirmed, 0.0));
    EXPECT_FALSE(t.set(Confirmation::GateLockedConfirmed, -1.0));
    EXPECT_FALSE(t.set(Confirmation::GateLockedConfirmed, std::numeric_limits<double>::infinity()));
    EXPECT_FALSE(t.set(Confirmation::GateLockedConfirmed, std::numeric_limits<double>::quiet_NaN()));
    EXPECT_DOUBLE_EQ(t.gateLockedConfirmed, 2.0) << "Rejected values keep the default";

    EXPECT_FALSE(t.set(Confirmation::GateClosedConfirmed, 3000000.0));
    EXPECT_DOUBLE_EQ(t.gateClosedConfirmed, 180.0) << "Oversized timeouts are rejected";
    EXPECT_TRUE(t.set(Confirmation::GateClosedConfirmed, TimeoutConfig::kMaxSeconds));

    EXPECT_TRUE(t.set(Confirmation::GateLockedConfirmed, 0.25));
    EXPECT_DOUBLE_EQ(t.gateLockedConfirmed, 0.25);
}

TEST(TimeoutConfigTest, OverridesAreAppliedPerKey) {
    TimeoutConfig t;
    QStringList issues;
    const int rejected = t.applyOverrides(parse(R"({
        "partition_open_reached": 15,
        "gate_locked_confirmed": -3,
        "gate_closed_confirmed": "soon",
        "coffee_ready": 4
    })"), &issues);

    EXPECT_EQ(rejected, 3);
    EXPECT_EQ(issues.size(), 3);
    EXPECT_DOUBLE_EQ(t.partitionOpenReached, 15.0);
    EXPECT_DOUBLE_EQ(t.gateLockedConfirmed, 2.0);
    EXPECT_DOUBLE_EQ(t.gateClosedConfirmed, 180.0);
}

TEST(ChamberConfigTest, OversizedTimeoutIsReported) {
    const ChamberConfig c = ChamberConfig::fromJson(parse(R"({
        "timeouts": {"gate_closed_confirmed": 3000000}
    })"));

    EXPECT_DOUBLE_EQ(c.timeouts.gateClosedConfirmed, 180.0);
    ASSERT_EQ(c.issues.size(), 1);
    EXPECT_TRUE(c.issues.first().contains("gate_closed_confirmed"));
}

TEST(ChamberConfigTest, EmptyObjectGivesDefaults) {
    const ChamberConfig c = ChamberConfig::fromJson(QJsonObject());
    EXPECT_EQ(c.deviceName, QString("chamber"));
    EXPECT_EQ(c.cyclePeriodMs, 100);
    EXPECT_EQ(c.partitionSpeed, 3000);
    EXPECT_EQ(c.productSensors, 2);
    EXPECT_EQ(c.sauceSensors, 0);
    EXPECT_FALSE(c.lockFeedback);
    EXPECT_TRUE(c.indicator);
    EXPECT_EQ(c.udpPort, 4210);
}

TEST(ChamberConfigTest, ReadsEveryKey) {
    const ChamberConfig c = ChamberConfig::fromJson(parse(R"({
        "device_name": "chamber_2",
        "cycle_period_ms": 50,
        "partition_speed": 1500,
        "product_sensors": 3,
        "sauce_sensors": 2,
        "lock_feedback": true,
        "indicator": false,
        "udp_port": 5000,
        "timeouts": {"gate_unlocked_confirmed": 4.5}
    })"));

    EXPECT_EQ(c.deviceName, QString("chamber_2"));
    EXPECT_EQ(c.cyclePeriodMs, 50);
    EXPECT_EQ(c.partitionSpeed, 1500);
    EXPECT_EQ(c.productSensors, 3);
    EXPECT_EQ(c.sauceSensors, 2);
    EXPECT_TRUE(c.lockFeedback);
    EXPECT_FALSE(c.indicator);
    EXPECT_EQ(c.udpPort, 5000);
    EXPECT_DOUBLE_EQ(c.timeouts.gateUnlockedConfirmed, 4.5);
    EXPECT_TRUE(c.issues.isEmpty());
}

TEST(ChamberConfigTest, InvalidValuesKeepDefaults) {
    const ChamberConfig c = ChamberConfig::fromJson(parse(R"({
        "device_name": "   ",
        "cycle_period_ms": 2.5,
        "partition_speed": 0,
        "udp_port": 70000,
        "indicator": "yes",
        "timeouts": 12
    })"));

    EXPECT_EQ(c.deviceName, QString("chamber"));
    EXPECT_EQ(c.cyclePeriodMs, 100);
    EXPECT_EQ(c.partitionSpeed, 3000);
    EXPECT_EQ(c.udpPort, 4210);
    EXPECT_TRUE(c.indicator);
    EXPECT_DOUBLE_EQ(c.timeouts.gateClosedConfirmed, 180.0);
    EXPECT_EQ(c.issues.size(), 6) << "One issue per rejected key";
}

TEST(ChamberConfigTest, FromFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("chamber.json");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"({"device_name": "from_disk", "timeouts": {"partition_close_reached": 7}})");
    file.close();

    const ChamberConfig c = ChamberConfig::fromFile(path);
    EXPECT_EQ(c.deviceName, QString("from_disk"));
    EXPECT_DOUBLE_EQ(c.timeouts.partitionCloseReached, 7.0);
}

TEST(ChamberConfigTest, FromFileErrors) {
    EXPECT_THROW(ChamberConfig::fromFile("/nonexistent/chamber.json"), ConfigError);

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("broken.json");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();
    EXPECT_THROW(ChamberConfig::fromFile(path), ConfigError);

    QFile array(dir.filePath("array.json"));
    ASSERT_TRUE(array.open(QIODevice::WriteOnly));
    array.write("[1, 2]");
    array.close();
    EXPECT_THROW(ChamberConfig::fromFile(dir.filePath("array.json")), ConfigError);
}
