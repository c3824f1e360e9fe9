/* PURPOSE:
 * Capability tables through which the controller reaches the chamber hardware.
 * Resolved once at construction; the transport behind each entry is not our business.
*/

#pragma once
#include <QMap>
#include <QString>
#include <functional>
#include <stdexcept>
#include "types.hpp"

// Thrown by a read or write capability when the underlying I/O call fails.
class HardwareIoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using ReadCapability = std::function<bool()>;

// Logical signal name -> read capability.
using SensorTable = QMap<QString, ReadCapability>;

namespace SignalNames {
    constexpr const char* ChamberOpen = "chamber_open";
    constexpr const char* PartitionUp = "partition_up";
    constexpr const char* PartitionDown = "partition_down";
    constexpr const char* MotorFault = "motor_fault";
    constexpr const char* LockFeedback = "lock_feedback";   // true = coil reports locked

    // 1-based: product_sensor_1, product_sensor_2, ...
    QString productSensor(int index);
    QString sauceSensor(int index);
}

struct ActuatorTable {
    std::function<void(LockState)> setLock;
    std::function<void(PartitionDirection, int speed)> movePartition;
    std::function<void()> stopPartition;
    std::function<void()> resetMotorFault;
    std::function<void(IndicatorColor)> setIndicator;   // optional, chambers without LEDs leave it empty
};
