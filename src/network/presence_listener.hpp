#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QList>
#include <QObject>
#include <chrono>
#include <memory>

class QUdpSocket;
class QTimer;

namespace lanmail::network {

class PeerRegistry;

/**
 * PresenceListener - turns presence announcements into registry updates.
 *
 * Malformed datagrams and our own announcements are dropped without noise;
 * the broadcast port is shared with whatever else runs on the LAN. A separate
 * timer expires peers that stopped announcing.
 */
class PresenceListener final : public QObject {
    Q_OBJECT

public:
    static constexpr quint16 DEFAULT_PORT = 37220;
    static constexpr int DEFAULT_STALE_CHECK_INTERVAL_MS = 30000;

    /**
     * @param registry Registry to update; must outlive the listener.
     */
    explicit PresenceListener(PeerRegistry& registry, QObject* parent = nullptr);
    ~PresenceListener() override;

    /**
     * Bind the presence port (0 picks an ephemeral port) and start the
     * expiry timer.
     */
    Result<void> start(quint16 port = DEFAULT_PORT);
    void stop();

    [[nodiscard]] bool isListening() const;
    [[nodiscard]] quint16 port() const;

    void setStaleCheckInterval(int interval_ms);
    void setStaleThreshold(std::chrono::milliseconds threshold) { stale_threshold_ = threshold; }

    /**
     * Addresses treated as "us". Defaults to enumerateLocalAddresses().
     */
    void setLocalAddresses(QList<QHostAddress> addresses) { local_addresses_ = std::move(addresses); }
    [[nodiscard]] const QList<QHostAddress>& localAddresses() const { return local_addresses_; }

    /**
     * All IPv4, non-loopback addresses of this machine's interfaces.
     */
    [[nodiscard]] static QList<QHostAddress> enumerateLocalAddresses();

    /**
     * Process one datagram as if it arrived from `sender`.
     * @return true if the registry was updated.
     */
    bool handleDatagram(const QByteArray& datagram, const QHostAddress& sender);

    [[nodiscard]] bool isLocalAddress(const QHostAddress& address) const;

public slots:
    void pruneStale();

private slots:
    void onReadyRead();

private:
    PeerRegistry& registry_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> stale_timer_;
    QList<QHostAddress> local_addresses_;
    std::chrono::milliseconds stale_threshold_;
};

} // namespace lanmail::network
