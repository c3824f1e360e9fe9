#include "command_server.hpp"
#include "command_protocol.hpp"
#include <QDebug>
#include <QNetworkDatagram>

CommandServer::CommandServer(CommandInbox& inbox, const InterlockController& controller, QObject* parent)
    : QObject(parent),
      m_socket(new QUdpSocket(this)),
      m_inbox(inbox),
      m_controller(controller)
{
    connect(m_socket, &QUdpSocket::readyRead,
            this, &CommandServer::processPendingDatagrams);

    connect(&m_inbox, &CommandInbox::commandFinished,
            this, &CommandServer::onCommandFinished);
}

bool CommandServer::start(quint16 port) {
    if (!m_socket->bind(QHostAddress::AnyIPv4, port)) {
        qWarning() << "Failed to bind UDP socket on port" << port << ":" << m_socket->errorString();
        return false;
    }
    qInfo() << "CommandServer listening on UDP port" << port();
    return true;
}

void CommandServer::stop() {
    m_socket->close();
    m_requesters.clear();
}

void CommandServer::processPendingDatagrams() {
    while (m_socket->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = m_socket->receiveDatagram();
        const Peer peer{datagram.senderAddress(), static_cast<quint16>(datagram.senderPort())};
        const Request request = parseRequest(datagram.data());
        qDebug() << "Received:" << datagram.data() << "from" << peer.address.toString() << peer.port;

        switch (request.kind) {
            case Request::Kind::Ping:
                reply(peer, formatStatus(m_controller.status()));
                break;

            case Request::Kind::Query:
                reply(peer, formatQueryReply(request.argument, m_controller.instantQuery(request.argument)));
                break;

            case Request::Kind::Command: {
                const CommandInbox::SubmitResult result = m_inbox.submit(request.argument);
                if (result == CommandInbox::SubmitResult::Accepted)
                    m_requesters.insert(*commandFromName(request.argument), peer);
                reply(peer, formatSubmitReply(result, request.argument));
                break;
            }

            case Request::Kind::Invalid:
                qWarning() << "Rejected datagram:" << request.argument;
                reply(peer, formatSubmitReply(CommandInbox::SubmitResult::Unknown, request.argument));
                break;
        }
    }
}

void CommandServer::onCommandFinished(const CommandResult& result) {
    if (!m_requesters.contains(result.command))
        return;
    reply(m_requesters.take(result.command), formatCompletion(result));
}

void CommandServer::reply(const Peer& peer, const QByteArray& data) {
    if (m_socket->writeDatagram(data, peer.address, peer.port) == -1)
        qWarning() << "Failed to send reply:" << data << m_socket->errorString();
}
