#include "simulated_chamber.hpp"
#include <QDebug>
#include <QMutexLocker>

SimulatedChamber::SimulatedChamber(const ChamberConfig& config, int travelSteps, QObject* parent)
    : QObject(parent),
      m_travelSteps(qMax(1, travelSteps)),
      m_products(config.productSensors, false),
      m_sauces(config.sauceSensors, false),
      m_lockFeedback(config.lockFeedback)
{
    qDebug() << "[SIM] chamber model ready, partition travel" << m_travelSteps << "steps";
}

SensorTable SimulatedChamber::sensorTable() {
    SensorTable table;
    table.insert(SignalNames::ChamberOpen, [this] { return gateOpen(); });
    table.insert(SignalNames::PartitionUp, [this] {
        QMutexLocker lock(&m_mutex);
        return m_partitionPosition >= m_travelSteps;
    });
    table.insert(SignalNames::PartitionDown, [this] {
        QMutexLocker lock(&m_mutex);
        return m_partitionPosition <= 0;
    });
    table.insert(SignalNames::MotorFault, [this] {
        QMutexLocker lock(&m_mutex);
        return m_motorFault;
    });
    if (m_lockFeedback)
        table.insert(SignalNames::LockFeedback, [this] { return lockEngaged(); });

    for (int i = 1; i <= m_products.size(); ++i)
        table.insert(SignalNames::productSensor(i), [this, i] { return readProduct(i); });
    for (int i = 1; i <= m_sauces.size(); ++i)
        table.insert(SignalNames::sauceSensor(i), [this, i] { return readSauce(i); });
    return table;
}

ActuatorTable SimulatedChamber::actuatorTable() {
    ActuatorTable table;
    table.setLock = [this](LockState lock) { setLock(lock); };
    table.movePartition = [this](PartitionDirection direction, int speed) { movePartition(direction, speed); };
    table.stopPartition = [this] { stopPartition(); };
    table.resetMotorFault = [this] { resetMotorFault(); };
    table.setIndicator = [this](IndicatorColor color) { setIndicator(color); };
    return table;
}

bool SimulatedChamber::lockEngaged() const {
    QMutexLocker lock(&m_mutex);
    return m_lockEngaged;
}

bool SimulatedChamber::gateOpen() const {
    QMutexLocker lock(&m_mutex);
    return m_gateOpen;
}

void SimulatedChamber::advance() {
    QMutexLocker lock(&m_mutex);
    if (m_motion == 0 || m_motorFault)
        return;

    m_partitionPosition = qBound(0, m_partitionPosition + m_motion, m_travelSteps);
    if (m_partitionPosition == 0 || m_partitionPosition == m_travelSteps) {
        qDebug() << "[SIM] partition reached" << (m_partitionPosition == 0 ? "bottom" : "top");
        m_motion = 0;
    }
}

void SimulatedChamber::setGateOpen(bool open) {
    QMutexLocker lock(&m_mutex);
    if (open && m_lockEngaged) {
        qInfo() << "[SIM] client gate is locked, cannot open";
        return;
    }
    m_gateOpen = open;
    qDebug() << "[SIM] client gate" << (open ? "opened" : "closed");
}

void SimulatedChamber::setProductPresent(int index, bool present) {
    QMutexLocker lock(&m_mutex);
    if (index >= 1 && index <= m_products.size())
        m_products[index - 1] = present;
}

void SimulatedChamber::setSaucePresent(int index, bool present) {
    QMutexLocker lock(&m_mutex);
    if (index >= 1 && index <= m_sauces.size())
        m_sauces[index - 1] = present;
}

void SimulatedChamber::injectMotorFault() {
    QMutexLocker lock(&m_mutex);
    m_motorFault = true;
    m_motion = 0;
    qDebug() << "[SIM] partition motor fault";
}

void SimulatedChamber::setLock(LockState state) {
    QMutexLocker lock(&m_mutex);
    m_lockEngaged = (state == LockState::Locked);
    qDebug() << "[LOCK_HW] relay" << (m_lockEngaged ? "ON (locked)" : "OFF (unlocked)");
}

void SimulatedChamber::movePartition(PartitionDirection direction, int speed) {
    QMutexLocker lock(&m_mutex);
    m_motion = (direction == PartitionDirection::Open) ? 1 : -1;
    qDebug() << "[PARTITION_HW] move" << (m_motion > 0 ? "up" : "down") << "speed" << speed;
}

void SimulatedChamber::stopPartition() {
    QMutexLocker lock(&m_mutex);
    m_motion = 0;
    qDebug() << "[PARTITION_HW] stop";
}

void SimulatedChamber::resetMotorFault() {
    QMutexLocker lock(&m_mutex);
    m_motorFault = false;
    qDebug() << "[PARTITION_HW] fault reset";
}

void SimulatedChamber::setIndicator(IndicatorColor color) {
    QMutexLocker lock(&m_mutex);
    if (color != m_indicator)
        qDebug() << "[LED_HW]" << (color == IndicatorColor::White ? "white" : "red");
    m_indicator = color;
}

bool SimulatedChamber::readProduct(int index) const {
    QMutexLocker lock(&m_mutex);
    return m_products.value(index - 1, false);
}

bool SimulatedChamber::readSauce(int index) const {
    QMutexLocker lock(&m_mutex);
    return m_sauces.value(index - 1, false);
}
