/* PURPOSE:
 * Text protocol spoken over UDP with external actors.
 *   PING | STATE            -> OK STATE=<state> STATUS=<status>
 *   <command>              -> ACCEPTED|BUSY <command>, UNKNOWN <text>; later DONE <command> SUCCESS|ERROR [message]
 *   QUERY <query>          -> VALUE <query> <1|0|-1>
*/

#pragma once
#include <QByteArray>
#include <QString>
#include "command_inbox.hpp"
#include "types.hpp"

struct Request {
    enum class Kind {
        Ping,
        Command,
        Query,
        Invalid
    };

    Kind kind;
    QString argument;
};

Request parseRequest(const QByteArray& datagram);

QByteArray formatStatus(const ChamberStatus& status);
QByteArray formatSubmitReply(CommandInbox::SubmitResult result, const QString& name);
QByteArray formatCompletion(const CommandResult& result);
QByteArray formatQueryReply(const QString& query, int value);
