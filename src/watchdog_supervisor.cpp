#include "watchdog_supervisor.hpp"
#include <QDebug>
#include <cmath>
#include <exception>
#include <limits>
#include <utility>

namespace {

// Far enough out to never fire, small enough that now + span cannot overflow.
constexpr qint64 kMaxSpanMs = std::numeric_limits<qint64>::max() / 4;

qint64 timeoutToMs(double timeoutS) {
    const double ms = std::ceil(timeoutS * 1000.0);
    if (!(ms < static_cast<double>(kMaxSpanMs)))
        return kMaxSpanMs;
    return ms > 0.0 ? static_cast<qint64>(ms) : 0;
}

}  // namespace

WatchdogSupervisor::WatchdogSupervisor(const Clock& clock, QObject* parent)
    : QObject(parent),
      m_clock(clock)
{}

WatchdogHandle WatchdogSupervisor::registerCheck(std::function<bool()> predicate,
                                                 double timeoutS,
                                                 const QString& description,
                                                 std::function<void(const WatchdogEntry&)> onTimeout,
                                                 const QVariantMap& metadata)
{
    const qint64 now = m_clock.nowMs();

    WatchdogEntry entry;
    entry.id = m_nextId++;
    entry.predicate = std::move(predicate);
    entry.deadlineMs = now + timeoutToMs(timeoutS);
    entry.description = description;
    entry.onTimeout = std::move(onTimeout);
    entry.metadata = metadata;
    entry.createdAtMs = now;
    m_entries.append(std::move(entry));

    qDebug() << "Watchdog" << m_entries.last().id << "armed:" << description
             << "within" << timeoutS << "s";
    return m_entries.last().id;
}

void WatchdogSupervisor::evaluate(qint64 nowMs) {
    // Callbacks may register new checks; those are looked at on the next pass.
    QVector<WatchdogEntry> current;
    current.swap(m_entries);

    QVector<WatchdogEntry> keep;
    for (const WatchdogEntry& entry : current) {
        try {
            if (entry.predicate())
                continue;
            if (nowMs < entry.deadlineMs) {
                keep.append(entry);
                continue;
            }

            qWarning() << "Watchdog timeout:" << entry.description << entry.metadata;
            if (entry.onTimeout)
                entry.onTimeout(entry);
            emit expired(entry.id, entry.description, entry.metadata);
        } catch (const std::exception& e) {
            qWarning() << "Watchdog" << entry.id << "(" << entry.description << ") failed:" << e.what();
        } catch (...) {
            qWarning() << "Watchdog" << entry.id << "(" << entry.description << ") failed: unknown error";
        }
    }

    keep.append(m_entries);
    m_entries.swap(keep);
}

bool WatchdogSupervisor::cancel(WatchdogHandle id) {
    for (int i = 0; i < m_entries.size(); ++i) {
        if (m_entries.at(i).id == id) {
            m_entries.removeAt(i);
            return true;
        }
    }
    return false;
}
