#pragma once
#include <QStringList>
#include <QVector>
#include <optional>
#include "io_capabilities.hpp"

// Settable inputs and recorded outputs standing in for the chamber I/O.
struct FakeChamberIo {
    bool chamberOpen = false;
    bool partitionUp = false;
    bool partitionDown = true;
    bool motorFault = false;
    std::optional<bool> lockFeedback;   // set before building the table to expose the signal
    QVector<bool> products = {false, false};
    QVector<bool> sauces = {false, false, false};
    bool withIndicator = true;

    bool failReads = false;
    bool failWrites = false;
    bool failPartitionMoves = false;
    bool failUnlock = false;
    bool throwUnknown = false;     // reads throw a non-std exception

    QStringList writeOrder;

    QVector<LockState> lockWrites;
    QVector<PartitionDirection> partitionMoves;
    QVector<int> partitionSpeeds;
    QVector<IndicatorColor> indicators;
    int faultResets = 0;
    int stops = 0;

    SensorTable sensorTable() {
        SensorTable table;
        table.insert(SignalNames::ChamberOpen, [this] { return read(chamberOpen); });
        table.insert(SignalNames::PartitionUp, [this] { return read(partitionUp); });
        table.insert(SignalNames::PartitionDown, [this] { return read(partitionDown); });
        table.insert(SignalNames::MotorFault, [this] { return read(motorFault); });
        if (lockFeedback)
            table.insert(SignalNames::LockFeedback, [this] { return read(*lockFeedback); });
        for (int i = 1; i <= products.size(); ++i)
            table.insert(SignalNames::productSensor(i), [this, i] { return read(products[i - 1]); });
        for (int i = 1; i <= sauces.size(); ++i)
            table.insert(SignalNames::sauceSensor(i), [this, i] { return read(sauces[i - 1]); });
        return table;
    }

    ActuatorTable actuatorTable() {
        ActuatorTable table;
        table.setLock = [this](LockState lock) {
            write();
            if (failUnlock && lock == LockState::Unlocked)
                throw HardwareIoError("lock relay did not release");
            lockWrites.append(lock);
            writeOrder << "lock";
        };
        table.movePartition = [this](PartitionDirection direction, int speed) {
            write();
            if (failPartitionMoves)
                throw HardwareIoError("partition drive not responding");
            partitionMoves.append(direction);
            writeOrder << "partition";
            partitionSpeeds.append(speed);
        };
        table.stopPartition = [this] { ++stops; };
        table.resetMotorFault = [this] {
            write();
            ++faultResets;
            motorFault = false;
        };
        if (withIndicator)
            table.setIndicator = [this](IndicatorColor color) { indicators.append(color); };
        return table;
    }

private:
    bool read(bool value) const {
        if (failReads)
            throw HardwareIoError("fieldbus read timeout");
        if (throwUnknown)
            throw 42;
        return value;
    }

    void write() const {
        if (failWrites)
            throw HardwareIoError("fieldbus write rejected");
    }
};
