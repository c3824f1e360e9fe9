/* PURPOSE
 * Handles all UDP communication with external actors: commands go into the inbox,
 * completions go back to whoever sent them.
*/

#pragma once
#include <QHostAddress>
#include <QMap>
#include <QObject>
#include <QUdpSocket>
#include "command_inbox.hpp"
#include "interlock_controller.hpp"

class CommandServer : public QObject {
    Q_OBJECT
public:
    CommandServer(CommandInbox& inbox, const InterlockController& controller, QObject* parent = nullptr);
    bool start(quint16 port);
    void stop();
    quint16 port() const { return m_socket->localPort(); }

private slots:
    void processPendingDatagrams();
    void onCommandFinished(const CommandResult& result);

private:
    struct Peer {
        QHostAddress address;
        quint16 port;
    };

    void reply(const Peer& peer, const QByteArray& data);

    QUdpSocket* m_socket;
    CommandInbox& m_inbox;
    const InterlockController& m_controller;
    QMap<Command, Peer> m_requesters;
};
