#pragma once

#include <QHostAddress>
#include <QObject>
#include <QString>
#include <memory>

class QUdpSocket;
class QTimer;

namespace lanmail::network {

/**
 * PresenceBroadcaster - announces this instance on the LAN.
 *
 * Sends `{"type":"node_mailer_instance","name":...}` immediately on start and
 * then every interval. Sending is fire-and-forget: failures are logged and the
 * next tick simply tries again.
 */
class PresenceBroadcaster final : public QObject {
    Q_OBJECT

public:
    static constexpr quint16 DEFAULT_PORT = 37220;
    static constexpr int DEFAULT_INTERVAL_MS = 2000;

    explicit PresenceBroadcaster(QObject* parent = nullptr);
    ~PresenceBroadcaster() override;

    void setTarget(const QHostAddress& address, quint16 port);
    void setInterval(int interval_ms);

    void start(const QString& name);
    void stop();

    [[nodiscard]] bool isRunning() const;
    [[nodiscard]] QString name() const { return name_; }

    /**
     * Send one announcement now.
     * @return true if the datagram was handed to the OS.
     */
    bool announceOnce();

signals:
    void announced();

private:
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> timer_;

    QHostAddress target_address_{QHostAddress::Broadcast};
    quint16 target_port_ = DEFAULT_PORT;
    QString name_;
    QByteArray payload_;
};

} // namespace lanmail::network
