/* Purpose:
 * Periodic control-cycle driver. Lives on the controller's thread so tick() handlers
 * run synchronously and never overlap; cycles longer than the period are reported.
*/

#pragma once
#include <QElapsedTimer>
#include <QObject>
#include <QTimer>

class Heartbeat : public QObject {
    Q_OBJECT
public:
    explicit Heartbeat(QObject* parent = nullptr);

public slots:
    void start(int intervalMs);
    void stop();

signals:
    void tick();
    void stopped();

private slots:
    void onTimeout();

private:
    QTimer* m_timer;
    QElapsedTimer m_cycleTimer;
};
