#pragma once

#include "core/mail.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QObject>
#include <memory>
#include <unordered_map>

class QTcpServer;
class QTcpSocket;

namespace lanmail::network {

/**
 * MessageServer - receives mail on the messaging port.
 *
 * Each accepted connection accumulates bytes until the sender closes it; only
 * then is the buffer decoded as one envelope. Connections are independent, so
 * any number of senders can be mid-transfer at once. Undecodable input is
 * dropped.
 */
class MessageServer final : public QObject {
    Q_OBJECT

public:
    static constexpr quint16 DEFAULT_PORT = 37221;
    static constexpr qsizetype DEFAULT_MAX_MESSAGE_BYTES = 16 * 1024 * 1024;

    explicit MessageServer(QObject* parent = nullptr);
    ~MessageServer() override;

    /**
     * Start listening on a port.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<quint16> listen(quint16 port = DEFAULT_PORT);

    /**
     * Stop listening and abort every open connection.
     */
    void close();

    [[nodiscard]] quint16 port() const;
    [[nodiscard]] bool isListening() const;

    /**
     * Number of connections accepted but not yet closed.
     */
    [[nodiscard]] int openConnectionCount() const { return static_cast<int>(connections_.size()); }

    void setMaxMessageBytes(qsizetype bytes) { max_message_bytes_ = bytes; }

signals:
    void mailReceived(const lanmail::Mail& mail);
    void shutdownRequested();
    // A connection closed without a decodable envelope.
    void messageDropped();

private slots:
    void onNewConnection();

private:
    struct ReceivingConnection {
        QTcpSocket* socket = nullptr;
        QByteArray buffer;
    };

    void onReadyRead(QTcpSocket* socket);
    void onDisconnected(QTcpSocket* socket);
    void release(QTcpSocket* socket);

    std::unique_ptr<QTcpServer> server_;
    std::unordered_map<QTcpSocket*, ReceivingConnection> connections_;
    qsizetype max_message_bytes_ = DEFAULT_MAX_MESSAGE_BYTES;
};

} // namespace lanmail::network
