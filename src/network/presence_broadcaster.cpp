#include "network/presence_broadcaster.hpp"

#include "app/logging.hpp"
#include "network/presence_datagram.hpp"

#include <QTimer>
#include <QUdpSocket>

namespace lanmail::network {

PresenceBroadcaster::PresenceBroadcaster(QObject* parent)
    : QObject(parent)
    , socket_(std::make_unique<QUdpSocket>(this))
    , timer_(std::make_unique<QTimer>(this))
{
    timer_->setInterval(DEFAULT_INTERVAL_MS);
    connect(timer_.get(), &QTimer::timeout, this, &PresenceBroadcaster::announceOnce);
}

PresenceBroadcaster::~PresenceBroadcaster() {
    stop();
}

void PresenceBroadcaster::setTarget(const QHostAddress& address, quint16 port) {
    target_address_ = address;
    target_port_ = port;
}

void PresenceBroadcaster::setInterval(int interval_ms) {
    timer_->setInterval(interval_ms);
}

void PresenceBroadcaster::start(const QString& name) {
    name_ = name;
    payload_ = encode_presence_datagram(name_);

    qCInfo(lanmailDiscoveryLog) << "announcing" << name_ << "to"
                                << target_address_.toString() << "port" << target_port_
                                << "every" << timer_->interval() << "ms";
    timer_->start();
    announceOnce();
}

void PresenceBroadcaster::stop() {
    timer_->stop();
}

bool PresenceBroadcaster::isRunning() const {
    return timer_->isActive();
}

bool PresenceBroadcaster::announceOnce() {
    if (payload_.isEmpty()) return false;

    const auto written = socket_->writeDatagram(payload_, target_address_, target_port_);
    if (written != payload_.size()) {
        qCWarning(lanmailDiscoveryLog) << "presence broadcast failed:" << socket_->errorString();
        return false;
    }

    qCDebug(lanmailDiscoveryLog) << "announced" << name_;
    emit announced();
    return true;
}

} // namespace lanmail::network
