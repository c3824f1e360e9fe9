/* PURPOSE:
 * Host-side model of the chamber hardware (gate, lock relay, partition motor, presence sensors).
 * Hands out the same capability tables a fieldbus backend would, so the controller runs unchanged.
*/

#pragma once
#include <QMutex>
#include <QObject>
#include <QVector>
#include "config.hpp"
#include "io_capabilities.hpp"

class SimulatedChamber : public QObject {
    Q_OBJECT
public:
    explicit SimulatedChamber(const ChamberConfig& config, int travelSteps = 20, QObject* parent = nullptr);

    SensorTable sensorTable();
    ActuatorTable actuatorTable();

    bool lockEngaged() const;
    bool gateOpen() const;

public slots:
    // One physics step; partition travel from end to end takes travelSteps steps.
    void advance();

    // The client pushes or pulls the gate. Opening is refused while the lock is engaged.
    void setGateOpen(bool open);
    void setProductPresent(int index, bool present);
    void setSaucePresent(int index, bool present);
    void injectMotorFault();

private:
    void setLock(LockState lock);
    void movePartition(PartitionDirection direction, int speed);
    void stopPartition();
    void resetMotorFault();
    void setIndicator(IndicatorColor color);

    bool readProduct(int index) const;
    bool readSauce(int index) const;

    mutable QMutex m_mutex;
    int m_travelSteps;
    bool m_lockEngaged = false;
    bool m_gateOpen = false;
    int m_partitionPosition = 0;   // 0 = down, m_travelSteps = up
    int m_motion = 0;              // +1 raising, -1 lowering
    bool m_motorFault = false;
    IndicatorColor m_indicator = IndicatorColor::Red;
    QVector<bool> m_products;
    QVector<bool> m_sauces;
    bool m_lockFeedback;
};
