/* PURPOSE:
 * Monotonic time source for watchdog deadlines and command timestamps.
 * Tests substitute a manually advanced clock.
*/

#pragma once
#include <QElapsedTimer>

class Clock {
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
};

class SteadyClock : public Clock {
public:
    SteadyClock() { m_timer.start(); }
    qint64 nowMs() const override { return m_timer.elapsed(); }

private:
    QElapsedTimer m_timer;
};
