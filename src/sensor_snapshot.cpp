#include "sensor_snapshot.hpp"
#include <QStringList>
#include <algorithm>
#include <utility>

QString SignalNames::productSensor(int index) {
    return QString("product_sensor_%1").arg(index);
}

QString SignalNames::sauceSensor(int index) {
    return QString("sauce_sensor_%1").arg(index);
}

SensorSnapshot::SensorSnapshot(bool chamberOpen, bool partitionUp, bool partitionDown,
                               std::optional<LockState> lockConfirmed, bool motorFault,
                               QVector<bool> products, QVector<bool> sauces)
    : m_chamberOpen(chamberOpen),
      m_partitionUp(partitionUp),
      m_partitionDown(partitionDown),
      m_lockConfirmed(lockConfirmed),
      m_motorFault(motorFault),
      m_products(std::move(products)),
      m_sauces(std::move(sauces))
{}

bool SensorSnapshot::gateLocked() const {
    if (m_chamberOpen)
        return false;
    return m_lockConfirmed.value_or(LockState::Locked) == LockState::Locked;
}

bool SensorSnapshot::gateUnlocked() const {
    return m_chamberOpen || m_lockConfirmed == LockState::Unlocked;
}

bool SensorSnapshot::productPresent() const {
    return std::any_of(m_products.cbegin(), m_products.cend(), [](bool v) { return v; });
}

bool SensorSnapshot::saucePresent() const {
    return std::any_of(m_sauces.cbegin(), m_sauces.cend(), [](bool v) { return v; });
}

SensorReader::SensorReader(SensorTable table, int productSensors, int sauceSensors)
    : m_table(std::move(table)),
      m_productSensors(productSensors),
      m_sauceSensors(sauceSensors)
{
    QStringList required = {
        SignalNames::ChamberOpen,
        SignalNames::PartitionUp,
        SignalNames::PartitionDown,
        SignalNames::MotorFault
    };
    for (int i = 1; i <= m_productSensors; ++i)
        required << SignalNames::productSensor(i);
    for (int i = 1; i <= m_sauceSensors; ++i)
        required << SignalNames::sauceSensor(i);

    for (const QString& name : required) {
        if (!m_table.value(name))
            throw std::invalid_argument("no read capability for signal " + name.toStdString());
    }
}

bool SensorReader::read(const QString& name) const {
    return m_table.value(name)();
}

void SensorReader::refresh() {
    QVector<bool> products;
    products.reserve(m_productSensors);
    for (int i = 1; i <= m_productSensors; ++i)
        products.append(read(SignalNames::productSensor(i)));

    QVector<bool> sauces;
    sauces.reserve(m_sauceSensors);
    for (int i = 1; i <= m_sauceSensors; ++i)
        sauces.append(read(SignalNames::sauceSensor(i)));

    std::optional<LockState> lock;
    if (hasLockFeedback())
        lock = read(SignalNames::LockFeedback) ? LockState::Locked : LockState::Unlocked;

    m_snapshot = SensorSnapshot(read(SignalNames::ChamberOpen),
                                read(SignalNames::PartitionUp),
                                read(SignalNames::PartitionDown),
                                lock,
                                read(SignalNames::MotorFault),
                                std::move(products),
                                std::move(sauces));
}
