/* PURPOSE:
 * Define shared enums and structs used by the transition table, the controller,
 * the command inbox and the UDP endpoint.
*/

#pragma once
#include <QMetaType>
#include <QString>
#include <optional>

enum class InterlockState {
    Unknown,
    Initializing,
    InitError,
    ReleasedOpen,
    ReleasedClosed,
    BlockedOpening,
    BlockedOpened,
    BlockedClosing,
    BlockedClosed,
    BlockedOpenConveyorMoving,
    EnablingMaintenance,
    Maintenance,
    DisablingMaintenance
};

// Coarse lifecycle of the chamber as seen by its owner.
enum class DeviceStatus {
    Uninitialized,
    Initializing,
    Working,
    Error
};

enum class LockState {
    Locked,
    Unlocked
};

enum class PartitionDirection {
    Open,   // partition up, conveyor side reachable
    Close   // partition down
};

enum class IndicatorColor {
    Red,
    White
};

enum class Command {
    Initialize,
    BlockForClient,
    UnblockForClient,
    BlockChamber,
    UnblockChamber,
    PartitionUp,
    PartitionDown,
    MaintenanceEnable,
    MaintenanceDisable
};

enum class CommandOutcome {
    Success,
    Error
};

enum class FaultKind {
    SafetyViolation,
    HardwareFault,
    ConfirmationTimeout,
    InitializationFailure,
    InvalidConfig
};

// Physical change a watchdog waits for. Names double as timeout config keys.
enum class Confirmation {
    PartitionOpenReached,
    PartitionCloseReached,
    GateLockedConfirmed,
    GateUnlockedConfirmed,
    GateClosedConfirmed
};

struct CommandResult {
    Command command;
    CommandOutcome outcome;
    QString message;
    qint64 submittedAtMs;
    qint64 finishedAtMs;
};

// Published once per cycle for queries, the UDP endpoint and the operator panel.
struct ChamberStatus {
    InterlockState state = InterlockState::Unknown;
    DeviceStatus status = DeviceStatus::Uninitialized;
    bool chamberOpen = false;
    bool partitionUp = false;
    bool partitionDown = false;
    bool motorFault = false;
    bool productPresent = false;
    bool saucePresent = false;
    std::optional<LockState> nominalLock;
};

QString toString(InterlockState state);
QString toString(DeviceStatus status);
QString toString(LockState lock);
QString toString(Command command);
QString toString(CommandOutcome outcome);
QString toString(FaultKind kind);
QString toString(Confirmation confirmation);

std::optional<Command> commandFromName(const QString& name);

// EnablingMaintenance, Maintenance and DisablingMaintenance.
bool isMaintenanceState(InterlockState state);

Q_DECLARE_METATYPE(InterlockState)
Q_DECLARE_METATYPE(DeviceStatus)
Q_DECLARE_METATYPE(Command)
Q_DECLARE_METATYPE(FaultKind)
Q_DECLARE_METATYPE(CommandResult)
Q_DECLARE_METATYPE(ChamberStatus)
