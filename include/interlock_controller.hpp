/* PURPOSE:
 * Drives one product-transfer chamber: refreshes sensors, applies the transition table,
 * commands lock and partition, arms confirmation watchdogs and answers commands.
 * cycle() must be called from one thread at a time; queries and status reads are thread-safe.
*/

#pragma once
#include <QObject>
#include <QReadWriteLock>
#include <QStringList>
#include <optional>
#include "command_inbox.hpp"
#include "config.hpp"
#include "io_capabilities.hpp"
#include "sensor_snapshot.hpp"
#include "state_machine.hpp"
#include "watchdog_supervisor.hpp"

class InterlockController : public QObject {
    Q_OBJECT
public:
    // Throws std::invalid_argument when a mandatory capability is missing.
    InterlockController(const ChamberConfig& config,
                        SensorTable sensors,
                        ActuatorTable actuators,
                        CommandInbox& inbox,
                        const Clock& clock,
                        QObject* parent = nullptr);

    const QString& deviceName() const { return m_config.deviceName; }

    InterlockState state() const;
    DeviceStatus deviceStatus() const;
    ChamberStatus status() const;

    // is_chamber_open / is_product_present / is_sauce_present -> 1 or 0, anything else -> -1.
    int instantQuery(const QString& name) const;

    // Cycle thread only.
    std::optional<LockState> nominalLock() const { return m_nominalLock; }
    const SensorSnapshot& snapshot() const { return m_sensors.snapshot(); }
    const WatchdogSupervisor& watchdogs() const { return *m_watchdogs; }
    QStringList activeConfirmations() const;

public slots:
    void cycle();
    void shutdown();

signals:
    void stateChanged(InterlockState newState);
    void deviceStatusChanged(DeviceStatus status);
    void faultRaised(FaultKind kind, const QString& message);
    void statusUpdated(const ChamberStatus& status);

private slots:
    void onWatchdogExpired(WatchdogHandle id, const QString& description, const QVariantMap& metadata);

private:
    void report(FaultKind kind, const QString& message);
    void apply(const Decision& decision);
    void writeLock(LockState lock);
    void relock();
    void arm(Confirmation confirmation);
    void setState(InterlockState next);
    void setDeviceStatus(DeviceStatus status);
    void driveIndicator();
    void publish();

    ChamberConfig m_config;
    SensorReader m_sensors;
    ActuatorTable m_actuators;
    CommandInbox& m_inbox;
    const Clock& m_clock;
    WatchdogSupervisor* m_watchdogs;

    InterlockState m_state = InterlockState::Unknown;
    DeviceStatus m_deviceStatus = DeviceStatus::Uninitialized;
    std::optional<LockState> m_nominalLock;
    bool m_configReported = false;

    mutable QReadWriteLock m_publishLock;
    ChamberStatus m_published;
};
