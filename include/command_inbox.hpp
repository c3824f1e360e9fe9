/* PURPOSE:
 * Hand-off buffer between whoever issues chamber commands (UDP endpoint, operator panel,
 * any thread) and the single control-cycle thread that executes them.
*/

#pragma once
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QVector>
#include "clock.hpp"
#include "types.hpp"

struct PendingCommand {
    Command command;
    qint64 submittedAtMs;
};

class CommandInbox : public QObject {
    Q_OBJECT
public:
    enum class SubmitResult {
        Accepted,
        AlreadyPending,
        Unknown
    };

    explicit CommandInbox(const Clock& clock, QObject* parent = nullptr);

    // Thread-safe. A command already pending is not queued twice.
    SubmitResult submit(Command command);
    SubmitResult submit(const QString& name);

    // Cycle thread only.
    bool peek(Command command) const;
    bool take(Command command);
    QVector<Command> pendingCommands() const;

    // Records the outcome and notifies listeners of commandFinished.
    void complete(Command command, CommandOutcome outcome, const QString& message = QString());

    // Drains results finished since the previous call.
    QVector<CommandResult> takeFinished();

    int pendingCount() const;

signals:
    void commandFinished(const CommandResult& result);

private:
    const Clock& m_clock;
    mutable QMutex m_mutex;
    QMap<Command, PendingCommand> m_pending;
    QMap<Command, qint64> m_taken;   // submit time of commands taken but not yet completed
    QVector<CommandResult> m_finished;
};
