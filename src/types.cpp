#include "types.hpp"

QString toString(InterlockState state) {
    switch (state) {
        case InterlockState::Unknown: return "Unknown";
        case InterlockState::Initializing: return "Initializing";
        case InterlockState::InitError: return "InitError";
        case InterlockState::ReleasedOpen: return "ReleasedOpen";
        case InterlockState::ReleasedClosed: return "ReleasedClosed";
        case InterlockState::BlockedOpening: return "BlockedOpening";
        case InterlockState::BlockedOpened: return "BlockedOpened";
        case InterlockState::BlockedClosing: return "BlockedClosing";
        case InterlockState::BlockedClosed: return "BlockedClosed";
        case InterlockState::BlockedOpenConveyorMoving: return "BlockedOpenConveyorMoving";
        case InterlockState::EnablingMaintenance: return "EnablingMaintenance";
        case InterlockState::Maintenance: return "Maintenance";
        case InterlockState::DisablingMaintenance: return "DisablingMaintenance";
    }
    return "Unknown";
}

QString toString(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Uninitialized: return "Uninitialized";
        case DeviceStatus::Initializing: return "Initializing";
        case DeviceStatus::Working: return "Working";
        case DeviceStatus::Error: return "Error";
    }
    return "Uninitialized";
}

QString toString(LockState lock) {
    return (lock == LockState::Locked) ? "Locked" : "Unlocked";
}

QString toString(Command command) {
    switch (command) {
        case Command::Initialize: return "initialize";
        case Command::BlockForClient: return "block_for_client";
        case Command::UnblockForClient: return "unblock_for_client";
        case Command::BlockChamber: return "block_chamber";
        case Command::UnblockChamber: return "unblock_chamber";
        case Command::PartitionUp: return "partition_up";
        case Command::PartitionDown: return "partition_down";
        case Command::MaintenanceEnable: return "maintenance_enable";
        case Command::MaintenanceDisable: return "maintenance_disable";
    }
    return QString();
}

QString toString(CommandOutcome outcome) {
    return (outcome == CommandOutcome::Success) ? "SUCCESS" : "ERROR";
}

QString toString(FaultKind kind) {
    switch (kind) {
        case FaultKind::SafetyViolation: return "SafetyViolation";
        case FaultKind::HardwareFault: return "HardwareFault";
        case FaultKind::ConfirmationTimeout: return "ConfirmationTimeout";
        case FaultKind::InitializationFailure: return "InitializationFailure";
        case FaultKind::InvalidConfig: return "InvalidConfig";
    }
    return QString();
}

QString toString(Confirmation confirmation) {
    switch (confirmation) {
        case Confirmation::PartitionOpenReached: return "partition_open_reached";
        case Confirmation::PartitionCloseReached: return "partition_close_reached";
        case Confirmation::GateLockedConfirmed: return "gate_locked_confirmed";
        case Confirmation::GateUnlockedConfirmed: return "gate_unlocked_confirmed";
        case Confirmation::GateClosedConfirmed: return "gate_closed_confirmed";
    }
    return QString();
}

std::optional<Command> commandFromName(const QString& name) {
    static const Command all[] = {
        Command::Initialize,
        Command::BlockForClient,
        Command::UnblockForClient,
        Command::BlockChamber,
        Command::UnblockChamber,
        Command::PartitionUp,
        Command::PartitionDown,
        Command::MaintenanceEnable,
        Command::MaintenanceDisable
    };

    const QString key = name.trimmed().toLower();
    for (Command c : all) {
        if (toString(c) == key)
            return c;
    }
    return std::nullopt;
}

bool isMaintenanceState(InterlockState state) {
    return state == InterlockState::EnablingMaintenance
        || state == InterlockState::Maintenance
        || state == InterlockState::DisablingMaintenance;
}
