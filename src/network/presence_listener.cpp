#include "network/presence_listener.hpp"

#include "app/logging.hpp"
#include "network/peer_registry.hpp"
#include "network/presence_datagram.hpp"

#include <QNetworkDatagram>
#include <QNetworkInterface>
#include <QTimer>
#include <QUdpSocket>

namespace lanmail::network {

PresenceListener::PresenceListener(PeerRegistry& registry, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , stale_timer_(std::make_unique<QTimer>(this))
    , local_addresses_(enumerateLocalAddresses())
    , stale_threshold_(PeerRegistry::DEFAULT_STALE_THRESHOLD)
{
    stale_timer_->setInterval(DEFAULT_STALE_CHECK_INTERVAL_MS);
    connect(stale_timer_.get(), &QTimer::timeout, this, &PresenceListener::pruneStale);
}

PresenceListener::~PresenceListener() {
    stop();
}

QList<QHostAddress> PresenceListener::enumerateLocalAddresses() {
    QList<QHostAddress> out;
    for (const auto& address : QNetworkInterface::allAddresses()) {
        if (address.protocol() == QAbstractSocket::IPv4Protocol && !address.isLoopback()) {
            out.append(address);
        }
    }
    return out;
}

Result<void> PresenceListener::start(quint16 port) {
    if (socket_) {
        return Result<void>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(QHostAddress::AnyIPv4, port,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto msg = socket_->errorString().toStdString();
        socket_.reset();
        return Result<void>::err(Error{"cannot bind presence port: " + msg, ErrorCode::BindFailed});
    }

    connect(socket_.get(), &QUdpSocket::readyRead, this, &PresenceListener::onReadyRead);
    stale_timer_->start();

    qCInfo(lanmailDiscoveryLog) << "listening for presence on port" << socket_->localPort()
                                << "local addresses" << local_addresses_;
    return Result<void>::ok();
}

void PresenceListener::stop() {
    stale_timer_->stop();
    if (!socket_) return;
    socket_->close();
    socket_.reset();
}

bool PresenceListener::isListening() const {
    return socket_ != nullptr;
}

quint16 PresenceListener::port() const {
    return socket_ ? socket_->localPort() : 0;
}

void PresenceListener::setStaleCheckInterval(int interval_ms) {
    stale_timer_->setInterval(interval_ms);
}

bool PresenceListener::isLocalAddress(const QHostAddress& address) const {
    for (const auto& local : local_addresses_) {
        if (local.isEqual(address, QHostAddress::ConvertV4MappedToIPv4)) {
            return true;
        }
    }
    return false;
}

bool PresenceListener::handleDatagram(const QByteArray& datagram, const QHostAddress& sender) {
    auto decoded = decode_presence_datagram(datagram);
    if (decoded.is_err()) {
        qCDebug(lanmailDiscoveryLog) << "dropping datagram from" << sender.toString() << ":"
                                     << decoded.unwrap_err().message.c_str();
        return false;
    }

    if (isLocalAddress(sender)) {
        return false;
    }

    // Normalize so a v4-mapped sender and a plain v4 sender are the same peer.
    bool is_v4 = false;
    const auto v4 = sender.toIPv4Address(&is_v4);
    const QHostAddress address = is_v4 ? QHostAddress(v4) : sender;

    registry_.upsert(decoded.unwrap(), address);
    return true;
}

void PresenceListener::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        const QNetworkDatagram datagram = socket_->receiveDatagram();
        if (!datagram.isValid()) {
            continue;
        }
        handleDatagram(datagram.data(), datagram.senderAddress());
    }
}

void PresenceListener::pruneStale() {
    registry_.remove_stale(registry_.now(), stale_threshold_);
}

} // namespace lanmail::network
