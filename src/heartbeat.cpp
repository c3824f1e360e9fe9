#include "heartbeat.hpp"
#include <QDebug>

Heartbeat::Heartbeat(QObject* parent)
    : QObject(parent),
      m_timer(new QTimer(this))
{
    m_timer->setTimerType(Qt::PreciseTimer);
    connect(m_timer, &QTimer::timeout, this, &Heartbeat::onTimeout);
}

void Heartbeat::start(int intervalMs) {
    if (!m_timer->isActive()) {
        m_timer->start(intervalMs);
        qDebug() << "Heartbeat started at" << intervalMs << "ms interval.";
    }
}

void Heartbeat::stop() {
    if (m_timer->isActive()) {
        m_timer->stop();
        qDebug() << "Heartbeat stopped.";
        emit stopped();
    }
}

void Heartbeat::onTimeout() {
    m_cycleTimer.start();
    emit tick();

    const qint64 took = m_cycleTimer.elapsed();
    if (took > m_timer->interval())
        qWarning() << "Heartbeat: cycle took" << took << "ms, period is" << m_timer->interval() << "ms";
}
