/* PURPOSE:
 * One consistent picture of every chamber input per control cycle.
 * SensorReader is the single writer; everything else reads the last snapshot.
*/

#pragma once
#include <QVector>
#include <optional>
#include "io_capabilities.hpp"

class SensorSnapshot {
public:
    SensorSnapshot() = default;
    SensorSnapshot(bool chamberOpen, bool partitionUp, bool partitionDown,
                   std::optional<LockState> lockConfirmed, bool motorFault,
                   QVector<bool> products = {}, QVector<bool> sauces = {});

    bool chamberOpen() const { return m_chamberOpen; }
    bool partitionUp() const { return m_partitionUp; }
    bool partitionDown() const { return m_partitionDown; }
    std::optional<LockState> lockConfirmed() const { return m_lockConfirmed; }
    bool motorFault() const { return m_motorFault; }
    const QVector<bool>& products() const { return m_products; }
    const QVector<bool>& sauces() const { return m_sauces; }

    // Closed by the limit switch and, where the coil reports back, locked.
    bool gateLocked() const;
    bool gateUnlocked() const;
    bool gateClosed() const { return !m_chamberOpen; }
    bool productPresent() const;
    bool saucePresent() const;

private:
    bool m_chamberOpen = false;
    bool m_partitionUp = false;
    bool m_partitionDown = false;
    std::optional<LockState> m_lockConfirmed;
    bool m_motorFault = false;
    QVector<bool> m_products;
    QVector<bool> m_sauces;
};

class SensorReader {
public:
    // Throws std::invalid_argument when a mandatory signal has no capability.
    SensorReader(SensorTable table, int productSensors, int sauceSensors);

    // Reads every configured signal once. On HardwareIoError the previous snapshot is kept.
    void refresh();

    const SensorSnapshot& snapshot() const { return m_snapshot; }
    bool hasLockFeedback() const { return m_table.contains(SignalNames::LockFeedback); }

private:
    bool read(const QString& name) const;

    SensorTable m_table;
    int m_productSensors;
    int m_sauceSensors;
    SensorSnapshot m_snapshot;
};
