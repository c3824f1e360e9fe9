#include "interlock_controller.hpp"
#include <QDebug>
#include <QReadLocker>
#include <QWriteLocker>
#include <exception>
#include <utility>

InterlockController::InterlockController(const ChamberConfig& config,
                                         SensorTable sensors,
                                         ActuatorTable actuators,
                                         CommandInbox& inbox,
                                         const Clock& clock,
                                         QObject* parent)
    : QObject(parent),
      m_config(config),
      m_sensors(std::move(sensors), config.productSensors, config.sauceSensors),
      m_actuators(std::move(actuators)),
      m_inbox(inbox),
      m_clock(clock),
      m_watchdogs(new WatchdogSupervisor(clock, this))
{
    if (!m_actuators.setLock || !m_actuators.movePartition || !m_actuators.resetMotorFault)
        throw std::invalid_argument("lock, partition and motor-reset capabilities are required");

    if (m_config.indicator && !m_actuators.setIndicator) {
        qWarning() << m_config.deviceName << "- indicator enabled but no indicator output, disabling";
        m_config.indicator = false;
        m_config.issues << "indicator enabled but no indicator output";
    }

    connect(m_watchdogs, &WatchdogSupervisor::expired,
            this, &InterlockController::onWatchdogExpired);

    m_published.state = m_state;
    m_published.status = m_deviceStatus;
}

InterlockState InterlockController::state() const {
    QReadLocker lock(&m_publishLock);
    return m_published.state;
}

DeviceStatus InterlockController::deviceStatus() const {
    QReadLocker lock(&m_publishLock);
    return m_published.status;
}

ChamberStatus InterlockController::status() const {
    QReadLocker lock(&m_publishLock);
    return m_published;
}

int InterlockController::instantQuery(const QString& name) const {
    QReadLocker lock(&m_publishLock);
    if (name == "is_chamber_open")
        return m_published.chamberOpen ? 1 : 0;
    if (name == "is_product_present")
        return m_published.productPresent ? 1 : 0;
    if (name == "is_sauce_present")
        return m_published.saucePresent ? 1 : 0;
    return -1;
}

QStringList InterlockController::activeConfirmations() const {
    QStringList names;
    for (const WatchdogEntry& entry : m_watchdogs->entries())
        names << entry.metadata.value("confirmation").toString();
    return names;
}

void InterlockController::cycle() {
    // Already logged while loading; raised once listeners are connected.
    if (!m_configReported) {
        m_configReported = true;
        for (const QString& issue : m_config.issues)
            emit faultRaised(FaultKind::InvalidConfig, issue);
    }

    try {
        m_sensors.refresh();
    } catch (const std::exception& e) {
        qCritical() << m_config.deviceName << "- sensor refresh failed:" << e.what();
        m_watchdogs->evaluate(m_clock.nowMs());
        return;
    } catch (...) {
        qCritical() << m_config.deviceName << "- sensor refresh failed: unknown error";
        m_watchdogs->evaluate(m_clock.nowMs());
        return;
    }

    // Confirmations armed last cycle are judged against readings taken after the command.
    m_watchdogs->evaluate(m_clock.nowMs());

    const Decision decision = decideTransition(m_state, m_nominalLock,
                                               m_sensors.snapshot(), m_inbox.pendingCommands());

    for (const Fault& fault : decision.faults)
        report(fault.kind, fault.message);

    try {
        apply(decision);
    } catch (const std::exception& e) {
        qCritical() << m_config.deviceName << "- actuator write failed in" << toString(m_state)
                    << ":" << e.what();
        publish();
        return;
    } catch (...) {
        qCritical() << m_config.deviceName << "- actuator write failed in" << toString(m_state)
                    << ": unknown error";
        publish();
        return;
    }

    setState(decision.next);

    for (const Completion& completion : decision.completions) {
        if (m_inbox.take(completion.command))
            m_inbox.complete(completion.command, completion.outcome, completion.message);
    }

    driveIndicator();
    publish();
}

void InterlockController::shutdown() {
    if (m_actuators.stopPartition) {
        try {
            m_actuators.stopPartition();
        } catch (const std::exception& e) {
            qCritical() << m_config.deviceName << "- failed to stop partition:" << e.what();
        } catch (...) {
            qCritical() << m_config.deviceName << "- failed to stop partition: unknown error";
        }
    }
    m_watchdogs->clear();
    qInfo() << m_config.deviceName << "- controller stopped in state" << toString(m_state);
}

void InterlockController::report(FaultKind kind, const QString& message) {
    qCritical() << m_config.deviceName << "-" << toString(kind) << ":" << message;
    emit faultRaised(kind, message);
}

void InterlockController::apply(const Decision& decision) {
    // Locking goes first, unlocking last: a failed write never leaves the gate
    // released while the rest of the decision was not carried out.
    const bool unlocking = decision.lock == LockState::Unlocked;
    bool unlockSent = false;

    if (decision.lock && !unlocking)
        writeLock(*decision.lock);

    try {
        if (decision.partition) {
            m_actuators.movePartition(*decision.partition, m_config.partitionSpeed);
            qDebug() << m_config.deviceName << "- partition ->"
                     << (*decision.partition == PartitionDirection::Open ? "open" : "close");
        }

        if (decision.resetMotorFault)
            m_actuators.resetMotorFault();

        if (unlocking) {
            unlockSent = true;
            writeLock(LockState::Unlocked);
        }
    } catch (...) {
        // The relay state after a failed release is unknown.
        if (unlockSent && m_nominalLock != LockState::Unlocked)
            relock();
        throw;
    }

    for (Confirmation confirmation : decision.confirmations)
        arm(confirmation);
}

void InterlockController::writeLock(LockState lock) {
    m_actuators.setLock(lock);
    m_nominalLock = lock;
    qDebug() << m_config.deviceName << "- lock ->" << toString(lock);
}

void InterlockController::relock() {
    try {
        writeLock(LockState::Locked);
        qWarning() << m_config.deviceName << "- unlock abandoned, gate relocked";
    } catch (const std::exception& e) {
        qCritical() << m_config.deviceName << "- failed to relock gate:" << e.what();
    } catch (...) {
        qCritical() << m_config.deviceName << "- failed to relock gate: unknown error";
    }
}

void InterlockController::arm(Confirmation confirmation) {
    std::function<bool()> predicate;
    std::function<void(const WatchdogEntry&)> onTimeout;
    QString description;

    switch (confirmation) {
        case Confirmation::PartitionOpenReached:
            predicate = [this] { return m_sensors.snapshot().partitionUp(); };
            description = "partition did not open";
            break;
        case Confirmation::PartitionCloseReached:
            predicate = [this] { return m_sensors.snapshot().partitionDown(); };
            description = "partition did not close";
            break;
        case Confirmation::GateLockedConfirmed:
            predicate = [this] { return m_sensors.snapshot().gateLocked(); };
            description = "client gate was not locked";
            break;
        case Confirmation::GateUnlockedConfirmed:
            predicate = [this] { return m_sensors.snapshot().gateUnlocked(); };
            description = "client gate was not unlocked";
            break;
        case Confirmation::GateClosedConfirmed:
            predicate = [this] { return m_sensors.snapshot().gateClosed(); };
            description = "client gate was not closed";
            onTimeout = [this](const WatchdogEntry&) {
                qWarning() << m_config.deviceName << "- client gate left open past"
                           << m_config.timeouts.gateClosedConfirmed << "s";
            };
            break;
    }

    QVariantMap metadata;
    metadata.insert("device", m_config.deviceName);
    metadata.insert("confirmation", toString(confirmation));

    m_watchdogs->registerCheck(predicate, m_config.timeouts.seconds(confirmation),
                               m_config.deviceName + " - " + description, onTimeout, metadata);
}

void InterlockController::onWatchdogExpired(WatchdogHandle, const QString& description, const QVariantMap&) {
    // Advisory only; the table keeps driving transitions from the sensors.
    emit faultRaised(FaultKind::ConfirmationTimeout, description);
}

void InterlockController::setState(InterlockState next) {
    const InterlockState previous = m_state;

    if (previous == InterlockState::Unknown && m_deviceStatus == DeviceStatus::Uninitialized)
        setDeviceStatus(DeviceStatus::Initializing);

    if (next == InterlockState::InitError)
        setDeviceStatus(DeviceStatus::Error);
    else if (next == InterlockState::BlockedOpened && m_deviceStatus == DeviceStatus::Initializing)
        setDeviceStatus(DeviceStatus::Working);

    if (previous == next)
        return;

    m_state = next;
    qDebug() << m_config.deviceName << "- state" << toString(previous) << "->" << toString(next);

    if (next == InterlockState::Maintenance && !isMaintenanceState(previous))
        qInfo() << m_config.deviceName << "- maintenance mode: partition closing, client gate unlocked";
    else if (previous == InterlockState::DisablingMaintenance)
        qInfo() << m_config.deviceName << "- left maintenance mode";

    emit stateChanged(next);
}

void InterlockController::setDeviceStatus(DeviceStatus status) {
    if (m_deviceStatus == status)
        return;
    qInfo() << m_config.deviceName << "- device status" << toString(m_deviceStatus) << "->" << toString(status);
    m_deviceStatus = status;
    emit deviceStatusChanged(status);
}

void InterlockController::driveIndicator() {
    if (!m_config.indicator)
        return;
    try {
        m_actuators.setIndicator(indicatorFor(m_state));
    } catch (const std::exception& e) {
        qWarning() << m_config.deviceName << "- indicator write failed:" << e.what();
    } catch (...) {
        qWarning() << m_config.deviceName << "- indicator write failed: unknown error";
    }
}

void InterlockController::publish() {
    const SensorSnapshot& s = m_sensors.snapshot();
    ChamberStatus status;
    status.state = m_state;
    status.status = m_deviceStatus;
    status.chamberOpen = s.chamberOpen();
    status.partitionUp = s.partitionUp();
    status.partitionDown = s.partitionDown();
    status.motorFault = s.motorFault();
    status.productPresent = s.productPresent();
    status.saucePresent = s.saucePresent();
    status.nominalLock = m_nominalLock;

    {
        QWriteLocker lock(&m_publishLock);
        m_published = status;
    }
    emit statusUpdated(status);
}
