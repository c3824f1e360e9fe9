/* PURPOSE:
 * Registry of "the hardware must confirm this before the deadline" checks.
 * Knows nothing about chambers; evaluated synchronously from the control cycle.
*/

#pragma once
#include <QObject>
#include <QString>
#include <QVariantMap>
#include <QVector>
#include <functional>
#include "clock.hpp"

using WatchdogHandle = quint64;

struct WatchdogEntry {
    WatchdogHandle id;
    std::function<bool()> predicate;
    qint64 deadlineMs;
    QString description;
    std::function<void(const WatchdogEntry&)> onTimeout;
    QVariantMap metadata;
    qint64 createdAtMs;
};

class WatchdogSupervisor : public QObject {
    Q_OBJECT
public:
    explicit WatchdogSupervisor(const Clock& clock, QObject* parent = nullptr);

    /*
     * Deadline is now + timeoutS. Each call adds a new entry, even when an
     * identical check is already pending.
     */
    WatchdogHandle registerCheck(std::function<bool()> predicate,
                                 double timeoutS,
                                 const QString& description,
                                 std::function<void(const WatchdogEntry&)> onTimeout = nullptr,
                                 const QVariantMap& metadata = QVariantMap());

    // Drops satisfied entries silently, fires and drops overdue ones.
    void evaluate(qint64 nowMs);
    void evaluate() { evaluate(m_clock.nowMs()); }

    bool cancel(WatchdogHandle id);
    void clear() { m_entries.clear(); }

    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }
    const QVector<WatchdogEntry>& entries() const { return m_entries; }

signals:
    void expired(WatchdogHandle id, const QString& description, const QVariantMap& metadata);

private:
    const Clock& m_clock;
    QVector<WatchdogEntry> m_entries;
    WatchdogHandle m_nextId = 1;
};
