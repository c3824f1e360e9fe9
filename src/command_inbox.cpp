#include "command_inbox.hpp"
#include <QDebug>
#include <QMutexLocker>

CommandInbox::CommandInbox(const Clock& clock, QObject* parent)
    : QObject(parent),
      m_clock(clock)
{}

CommandInbox::SubmitResult CommandInbox::submit(Command command) {
    QMutexLocker lock(&m_mutex);
    if (m_pending.contains(command)) {
        qDebug() << "CommandInbox:" << toString(command) << "already in progress";
        return SubmitResult::AlreadyPending;
    }
    m_pending.insert(command, PendingCommand{command, m_clock.nowMs()});
    qDebug() << "CommandInbox: accepted" << toString(command);
    return SubmitResult::Accepted;
}

CommandInbox::SubmitResult CommandInbox::submit(const QString& name) {
    const std::optional<Command> command = commandFromName(name);
    if (!command) {
        qWarning() << "CommandInbox: unknown command" << name;
        return SubmitResult::Unknown;
    }
    return submit(*command);
}

bool CommandInbox::peek(Command command) const {
    QMutexLocker lock(&m_mutex);
    return m_pending.contains(command);
}

bool CommandInbox::take(Command command) {
    QMutexLocker lock(&m_mutex);
    auto it = m_pending.find(command);
    if (it == m_pending.end())
        return false;
    m_taken.insert(command, it->submittedAtMs);
    m_pending.erase(it);
    return true;
}

QVector<Command> CommandInbox::pendingCommands() const {
    QMutexLocker lock(&m_mutex);
    QVector<Command> commands;
    commands.reserve(m_pending.size());
    for (auto it = m_pending.cbegin(); it != m_pending.cend(); ++it)
        commands.append(it.key());
    return commands;
}

void CommandInbox::complete(Command command, CommandOutcome outcome, const QString& message) {
    CommandResult result{command, outcome, message, m_clock.nowMs(), m_clock.nowMs()};
    {
        QMutexLocker lock(&m_mutex);
        if (m_taken.contains(command))
            result.submittedAtMs = m_taken.take(command);
        else if (m_pending.contains(command))
            result.submittedAtMs = m_pending.take(command).submittedAtMs;
        m_finished.append(result);
    }

    if (outcome == CommandOutcome::Success)
        qDebug() << "CommandInbox:" << toString(command) << "finished";
    else
        qWarning() << "CommandInbox:" << toString(command) << "failed:" << message;

    emit commandFinished(result);
}

QVector<CommandResult> CommandInbox::takeFinished() {
    QMutexLocker lock(&m_mutex);
    QVector<CommandResult> drained;
    drained.swap(m_finished);
    return drained;
}

int CommandInbox::pendingCount() const {
    QMutexLocker lock(&m_mutex);
    return m_pending.size();
}
