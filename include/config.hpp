/* PURPOSE:
 * Per-chamber configuration: confirmation timeouts, sensor layout, cycle period, UDP port.
 * Everything has a default; bad values are rejected one key at a time.
*/

#pragma once
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <stdexcept>
#include "types.hpp"

// Unreadable or structurally invalid configuration file.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TimeoutConfig {
    double partitionOpenReached = 10.0;
    double partitionCloseReached = 10.0;
    double gateLockedConfirmed = 2.0;
    double gateUnlockedConfirmed = 2.0;
    double gateClosedConfirmed = 180.0;

    static constexpr double kMaxSeconds = 86400.0;

    double seconds(Confirmation confirmation) const;

    // Keeps the current value and returns false unless 0 < seconds <= kMaxSeconds.
    bool set(Confirmation confirmation, double seconds);

    // Applies a {"gate_locked_confirmed": 2.5, ...} object; returns the number of rejected keys.
    int applyOverrides(const QJsonObject& overrides, QStringList* issues = nullptr);
};

struct ChamberConfig {
    QString deviceName = "chamber";
    int cyclePeriodMs = 100;
    int partitionSpeed = 3000;
    int productSensors = 2;
    int sauceSensors = 0;
    bool lockFeedback = false;
    bool indicator = true;
    quint16 udpPort = 4210;
    TimeoutConfig timeouts;

    // Keys rejected while loading; the defaults were kept for each.
    QStringList issues;

    static ChamberConfig fromJson(const QJsonObject& json);
    static ChamberConfig fromFile(const QString& path);
};
