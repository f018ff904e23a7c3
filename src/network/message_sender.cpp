#include "network/message_sender.hpp"

#include "app/logging.hpp"
#include "network/mail_envelope.hpp"

#include <QTcpSocket>

namespace lanmail::network {
namespace {

Result<void> connection_error(const std::string& what, const QTcpSocket& socket) {
    return Result<void>::err(
        Error{what + " (" + socket.errorString().toStdString() + ")", ErrorCode::ConnectionError});
}

} // namespace

MessageSender::MessageSender(int connect_timeout_ms, int write_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms)
    , write_timeout_ms_(write_timeout_ms)
{
}

Result<void> MessageSender::send_mail(const Mail& mail, const QString& host, quint16 port) const {
    qCInfo(lanmailMessagingLog) << "sending mail to" << host << "port" << port;
    return deliver(encode_mail_envelope(mail), host, port);
}

Result<void> MessageSender::send_mail(const Mail& mail, const QHostAddress& address, quint16 port) const {
    return send_mail(mail, address.toString(), port);
}

void MessageSender::send_shutdown(quint16 local_port) const {
    const auto sent = deliver(encode_shutdown_envelope(),
                              QHostAddress(QHostAddress::LocalHost).toString(), local_port);
    sent.inspect_err([](const Error& e) {
        qCDebug(lanmailMessagingLog) << "no local instance to shut down:" << e.message.c_str();
    });
}

Result<void> MessageSender::deliver(const QByteArray& payload, const QString& host, quint16 port) const {
    QTcpSocket socket;
    socket.connectToHost(host, port);
    if (!socket.waitForConnected(connect_timeout_ms_)) {
        auto failed = connection_error("could not connect to peer - is it running?", socket);
        socket.abort();
        return failed;
    }

    if (socket.write(payload) != payload.size()) {
        auto failed = connection_error("could not write message", socket);
        socket.abort();
        return failed;
    }

    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(write_timeout_ms_)) {
            auto failed = connection_error("could not write message", socket);
            socket.abort();
            return failed;
        }
    }

    // Closing is the end-of-message marker for the receiver.
    socket.disconnectFromHost();
    if (socket.state() != QAbstractSocket::UnconnectedState &&
        !socket.waitForDisconnected(write_timeout_ms_)) {
        qCWarning(lanmailMessagingLog) << "peer" << host << "did not acknowledge close:"
                                       << socket.errorString();
        socket.abort();
    }

    qCDebug(lanmailMessagingLog) << "delivered" << payload.size() << "bytes to" << host;
    return Result<void>::ok();
}

} // namespace lanmail::network
