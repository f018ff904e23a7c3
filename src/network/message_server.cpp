#include "network/message_server.hpp"

#include "app/logging.hpp"
#include "network/mail_envelope.hpp"

#include <QTcpServer>
#include <QTcpSocket>
#include <vector>

namespace lanmail::network {

MessageServer::MessageServer(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &MessageServer::onNewConnection);
}

MessageServer::~MessageServer() {
    close();
}

Result<quint16> MessageServer::listen(quint16 port) {
    if (server_->isListening()) {
        return Result<quint16>::ok(server_->serverPort());
    }

    if (!server_->listen(QHostAddress::AnyIPv4, port)) {
        return Result<quint16>::err(
            Error{"cannot listen on messaging port: " + server_->errorString().toStdString(),
                  ErrorCode::BindFailed});
    }

    qCInfo(lanmailMessagingLog) << "listening for mail on port" << server_->serverPort();
    return Result<quint16>::ok(server_->serverPort());
}

void MessageServer::close() {
    server_->close();

    std::vector<QTcpSocket*> open;
    open.reserve(connections_.size());
    for (const auto& [socket, conn] : connections_) {
        open.push_back(socket);
    }
    for (auto* socket : open) {
        // Drop our bookkeeping first so the abort's disconnected signal is a no-op.
        release(socket);
        socket->abort();
    }
}

quint16 MessageServer::port() const {
    return server_->serverPort();
}

bool MessageServer::isListening() const {
    return server_->isListening();
}

void MessageServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        connections_.emplace(socket, ReceivingConnection{socket, {}});

        qCDebug(lanmailMessagingLog) << "accepted connection from"
                                     << socket->peerAddress().toString()
                                     << "open" << connections_.size();

        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
            onReadyRead(socket);
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            onDisconnected(socket);
        });

        // The peer may have written and closed before we got here.
        if (socket->bytesAvailable() > 0) {
            onReadyRead(socket);
        }
        if (socket->state() == QAbstractSocket::UnconnectedState) {
            onDisconnected(socket);
        }
    }
}

void MessageServer::onReadyRead(QTcpSocket* socket) {
    auto it = connections_.find(socket);
    if (it == connections_.end()) return;

    it->second.buffer.append(socket->readAll());

    if (it->second.buffer.size() > max_message_bytes_) {
        qCWarning(lanmailMessagingLog) << "dropping oversized message from"
                                       << socket->peerAddress().toString()
                                       << it->second.buffer.size() << "bytes";
        release(socket);
        socket->abort();
        emit messageDropped();
    }
}

void MessageServer::onDisconnected(QTcpSocket* socket) {
    auto it = connections_.find(socket);
    if (it == connections_.end()) return;

    // Anything still queued in the socket belongs to this message.
    it->second.buffer.append(socket->readAll());
    const QByteArray bytes = std::move(it->second.buffer);
    const auto peer = socket->peerAddress().toString();
    release(socket);

    auto decoded = decode_envelope(bytes);
    if (decoded.is_err()) {
        qCDebug(lanmailMessagingLog) << "dropping malformed message from" << peer << ":"
                                     << decoded.unwrap_err().message.c_str();
        emit messageDropped();
        return;
    }

    auto envelope = std::move(decoded).unwrap();
    if (envelope.kind == Envelope::Kind::Shutdown) {
        qCInfo(lanmailMessagingLog) << "shutdown requested by" << peer;
        emit shutdownRequested();
        return;
    }

    qCInfo(lanmailMessagingLog) << "mail from" << envelope.mail->sender_name << "via" << peer;
    emit mailReceived(*envelope.mail);
}

void MessageServer::release(QTcpSocket* socket) {
    if (connections_.erase(socket) == 0) return;
    socket->disconnect(this);
    socket->deleteLater();
}

} // namespace lanmail::network
