#include "command_protocol.hpp"

Request parseRequest(const QByteArray& datagram) {
    const QString msg = QString::fromUtf8(datagram).trimmed();
    if (msg.isEmpty())
        return {Request::Kind::Invalid, msg};

    const QString upper = msg.toUpper();
    if (upper == "PING" || upper == "STATE")
        return {Request::Kind::Ping, QString()};

    if (upper == "QUERY" || upper.startsWith("QUERY ")) {
        const QString query = msg.section(' ', 1, 1, QString::SectionSkipEmpty);
        if (query.isEmpty())
            return {Request::Kind::Invalid, msg};
        return {Request::Kind::Query, query};
    }

    if (msg.contains(' '))
        return {Request::Kind::Invalid, msg};
    return {Request::Kind::Command, msg.toLower()};
}

QByteArray formatStatus(const ChamberStatus& status) {
    return QString("OK STATE=%1 STATUS=%2")
        .arg(toString(status.state), toString(status.status))
        .toUtf8();
}

QByteArray formatSubmitReply(CommandInbox::SubmitResult result, const QString& name) {
    switch (result) {
        case CommandInbox::SubmitResult::Accepted: return ("ACCEPTED " + name).toUtf8();
        case CommandInbox::SubmitResult::AlreadyPending: return ("BUSY " + name).toUtf8();
        case CommandInbox::SubmitResult::Unknown: return ("UNKNOWN " + name).toUtf8();
    }
    return QByteArray();
}

QByteArray formatCompletion(const CommandResult& result) {
    QString msg = "DONE " + toString(result.command) + " " + toString(result.outcome);
    if (!result.message.isEmpty())
        msg += " " + result.message;
    return msg.toUtf8();
}

QByteArray formatQueryReply(const QString& query, int value) {
    return QString("VALUE %1 %2").arg(query).arg(value).toUtf8();
}
