#include "state_machine.hpp"

namespace {

void completeIfPending(Decision& d, const QVector<Command>& pending, Command command,
                       CommandOutcome outcome = CommandOutcome::Success,
                       const QString& message = QString())
{
    if (pending.contains(command))
        d.completions.append(Completion{command, outcome, message});
}

void decideBlocked(Decision& d, InterlockState state, const SensorSnapshot& s,
                   const QVector<Command>& pending)
{
    switch (state) {
        case InterlockState::BlockedOpening:
            if (s.partitionUp()) {
                d.next = InterlockState::BlockedOpened;
                completeIfPending(d, pending, Command::PartitionUp);
            }
            break;

        case InterlockState::BlockedOpened:
            completeIfPending(d, pending, Command::Initialize);
            if (pending.contains(Command::BlockChamber)) {
                d.next = InterlockState::BlockedOpenConveyorMoving;
                d.completions.append(Completion{Command::BlockChamber, CommandOutcome::Success, QString()});
            } else if (pending.contains(Command::PartitionDown)) {
                d.partition = PartitionDirection::Close;
                d.confirmations.append(Confirmation::PartitionCloseReached);
                d.next = InterlockState::BlockedClosing;
            }
            break;

        case InterlockState::BlockedClosing:
            if (s.motorFault()) {
                // The partition is treated as closed; the fault is reset and reported.
                d.resetMotorFault = true;
                d.faults.append(Fault{FaultKind::HardwareFault, "motor fault while closing partition, resetting"});
                completeIfPending(d, pending, Command::PartitionDown);
                d.next = InterlockState::BlockedClosed;
            } else if (s.partitionDown()) {
                completeIfPending(d, pending, Command::PartitionDown);
                d.next = InterlockState::BlockedClosed;
            }
            break;

        case InterlockState::BlockedClosed:
            if (pending.contains(Command::PartitionUp)) {
                d.partition = PartitionDirection::Open;
                d.confirmations.append(Confirmation::PartitionOpenReached);
                d.next = InterlockState::BlockedOpening;
            } else if (pending.contains(Command::UnblockForClient)) {
                d.lock = LockState::Unlocked;
                d.confirmations.append(Confirmation::GateUnlockedConfirmed);
                d.completions.append(Completion{Command::UnblockForClient, CommandOutcome::Success, QString()});
                d.next = InterlockState::ReleasedClosed;
            } else if (s.motorFault()) {
                d.resetMotorFault = true;
                d.faults.append(Fault{FaultKind::HardwareFault, "motor fault with partition closed, resetting"});
            }
            break;

        case InterlockState::BlockedOpenConveyorMoving:
            if (pending.contains(Command::UnblockChamber)) {
                d.completions.append(Completion{Command::UnblockChamber, CommandOutcome::Success, QString()});
                d.next = InterlockState::BlockedOpened;
            }
            break;

        default:
            break;
    }
}

}  // namespace

bool Decision::completes(Command command) const {
    for (const Completion& c : completions) {
        if (c.command == command)
            return true;
    }
    return false;
}

bool Decision::arms(Confirmation confirmation) const {
    return confirmations.contains(confirmation);
}

bool isSafetySupervised(InterlockState state) {
    switch (state) {
        case InterlockState::Unknown:
        case InterlockState::Initializing:
        case InterlockState::InitError:
        case InterlockState::EnablingMaintenance:
        case InterlockState::Maintenance:
        case InterlockState::DisablingMaintenance:
            return false;
        default:
            return true;
    }
}

IndicatorColor indicatorFor(InterlockState state) {
    return (state == InterlockState::ReleasedOpen) ? IndicatorColor::White : IndicatorColor::Red;
}

Decision decideTransition(InterlockState state,
                          std::optional<LockState> nominalLock,
                          const SensorSnapshot& s,
                          const QVector<Command>& pending)
{
    Decision d;

    if (state == InterlockState::Unknown)
        state = InterlockState::Initializing;
    d.next = state;

    // Maintenance pre-empts whatever the chamber was doing.
    if (!isMaintenanceState(state) && pending.contains(Command::MaintenanceEnable)) {
        d.completions.append(Completion{Command::MaintenanceEnable, CommandOutcome::Success, QString()});
        d.partition = PartitionDirection::Close;
        d.lock = LockState::Unlocked;
        d.next = InterlockState::Maintenance;
        return d;
    }

    if (isSafetySupervised(state) && nominalLock == LockState::Locked && s.chamberOpen())
        d.faults.append(Fault{FaultKind::SafetyViolation, "client gate sensed open while locked"});

    switch (state) {
        case InterlockState::Initializing:
            if (s.chamberOpen()) {
                d.faults.append(Fault{FaultKind::InitializationFailure, "client gate open at initialization"});
                completeIfPending(d, pending, Command::Initialize, CommandOutcome::Error,
                                  "chamber initialization failed: client gate open");
                d.next = InterlockState::InitError;
                break;
            }
            d.lock = LockState::Locked;
            d.confirmations.append(Confirmation::GateLockedConfirmed);
            if (!s.partitionUp()) {
                d.partition = PartitionDirection::Open;
                d.confirmations.append(Confirmation::PartitionOpenReached);
            }
            d.next = InterlockState::BlockedOpening;
            break;

        case InterlockState::InitError:
            completeIfPending(d, pending, Command::Initialize, CommandOutcome::Error,
                              "chamber initialization failed, restart required");
            break;

        case InterlockState::ReleasedClosed:
            if (s.chamberOpen()) {
                d.confirmations.append(Confirmation::GateClosedConfirmed);
                d.next = InterlockState::ReleasedOpen;
            } else if (pending.contains(Command::BlockForClient)) {
                d.lock = LockState::Locked;
                d.confirmations.append(Confirmation::GateLockedConfirmed);
                d.completions.append(Completion{Command::BlockForClient, CommandOutcome::Success, QString()});
                d.next = InterlockState::BlockedClosed;
            }
            break;

        case InterlockState::ReleasedOpen:
            if (!s.chamberOpen())
                d.next = InterlockState::ReleasedClosed;
            break;

        case InterlockState::EnablingMaintenance:
            d.next = InterlockState::Maintenance;
            break;

        case InterlockState::Maintenance:
            completeIfPending(d, pending, Command::MaintenanceEnable);
            if (pending.contains(Command::MaintenanceDisable)) {
                d.partition = PartitionDirection::Open;
                d.lock = LockState::Locked;
                d.confirmations.append(Confirmation::PartitionOpenReached);
                d.confirmations.append(Confirmation::GateLockedConfirmed);
                d.next = InterlockState::DisablingMaintenance;
            }
            break;

        case InterlockState::DisablingMaintenance:
            if (s.partitionUp() && s.gateLocked() && pending.contains(Command::MaintenanceDisable)) {
                d.completions.append(Completion{Command::MaintenanceDisable, CommandOutcome::Success, QString()});
                d.next = InterlockState::BlockedOpened;
            }
            break;

        default:
            decideBlocked(d, state, s, pending);
            break;
    }

    return d;
}
