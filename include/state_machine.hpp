/* PURPOSE:
 * Interlock transition table as a pure function of (state, nominal lock, sensors, pending commands).
 * No I/O and no clocks here, so every transition can be checked without hardware.
*/

#pragma once
#include <QString>
#include <QVector>
#include <optional>
#include "sensor_snapshot.hpp"
#include "types.hpp"

struct Completion {
    Command command;
    CommandOutcome outcome;
    QString message;
};

struct Fault {
    FaultKind kind;
    QString message;
};

// Everything one cycle should do, in the order the controller applies it.
struct Decision {
    InterlockState next = InterlockState::Unknown;
    std::optional<LockState> lock;
    std::optional<PartitionDirection> partition;
    bool resetMotorFault = false;
    QVector<Confirmation> confirmations;
    QVector<Completion> completions;
    QVector<Fault> faults;

    bool completes(Command command) const;
    bool arms(Confirmation confirmation) const;
};

Decision decideTransition(InterlockState state,
                          std::optional<LockState> nominalLock,
                          const SensorSnapshot& sensors,
                          const QVector<Command>& pending);

// Whether the "open while locked" check applies in this state.
bool isSafetySupervised(InterlockState state);

IndicatorColor indicatorFor(InterlockState state);
