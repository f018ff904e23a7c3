#include "app/mail_node.hpp"

#include "app/logging.hpp"
#include "network/message_server.hpp"
#include "network/peer_registry.hpp"
#include "network/presence_broadcaster.hpp"
#include "network/presence_listener.hpp"
#include "storage/favorites_store.hpp"

namespace lanmail::app {

MailNode::MailNode(NodeConfig config, storage::FavoritesStore& favorites, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , registry_(std::make_unique<network::PeerRegistry>(favorites, ClockFn{}, this))
    , broadcaster_(std::make_unique<network::PresenceBroadcaster>(this))
    , listener_(std::make_unique<network::PresenceListener>(*registry_, this))
    , server_(std::make_unique<network::MessageServer>(this))
    , sender_(config_.connect_timeout_ms)
{
    broadcaster_->setTarget(config_.broadcast_address, config_.broadcast_port);
    broadcaster_->setInterval(config_.broadcast_interval_ms);
    listener_->setStaleCheckInterval(config_.stale_check_interval_ms);
    listener_->setStaleThreshold(std::chrono::milliseconds(config_.stale_threshold_ms));

    connect(registry_.get(), &network::PeerRegistry::peersChanged,
            this, &MailNode::peersChanged);
    connect(server_.get(), &network::MessageServer::mailReceived,
            this, &MailNode::mailReceived);
    connect(server_.get(), &network::MessageServer::shutdownRequested,
            this, &MailNode::shutdownRequested);
}

MailNode::~MailNode() {
    stop();
}

bool MailNode::start() {
    if (running_) return true;

    auto listening = server_->listen(config_.messaging_port);
    if (listening.is_err()) {
        emit error(QString::fromStdString(listening.unwrap_err().message));
        return false;
    }

    auto browsing = listener_->start(config_.broadcast_port);
    if (browsing.is_err()) {
        server_->close();
        emit error(QString::fromStdString(browsing.unwrap_err().message));
        return false;
    }

    broadcaster_->start(config_.name);
    running_ = true;

    qCInfo(lanmailNodeLog) << "node" << config_.name << "up: mail port" << server_->port()
                           << "presence port" << listener_->port();
    return true;
}

void MailNode::stop() {
    if (!running_) return;

    broadcaster_->stop();
    listener_->stop();
    server_->close();
    registry_->clear();
    running_ = false;

    qCInfo(lanmailNodeLog) << "node" << config_.name << "stopped";
}

Mail MailNode::composeMail(const QString& message, const QString& node_string) const {
    Mail mail;
    mail.sender_name = config_.name;
    mail.message = message;
    mail.node_string = node_string;
    mail.timestamp = unix_time_seconds();
    return mail;
}

Result<void> MailNode::sendMail(const QString& peer_name,
                                const QString& message,
                                const QString& node_string) {
    const auto peer = registry_->find(peer_name);
    if (!peer) {
        return Result<void>::err(
            Error{"no peer named '" + peer_name.toStdString() + "'", ErrorCode::PeerNotFound});
    }
    return sender_.send_mail(composeMail(message, node_string), peer->address, config_.messaging_port);
}

Result<void> MailNode::sendMailTo(const QString& host,
                                  quint16 port,
                                  const QString& message,
                                  const QString& node_string) {
    return sender_.send_mail(composeMail(message, node_string), host, port);
}

Result<Peer> MailNode::toggleFavorite(const QString& peer_name) {
    return registry_->toggle_favorite(peer_name);
}

quint16 MailNode::messagingPort() const {
    return server_->port();
}

quint16 MailNode::presencePort() const {
    return listener_->port();
}

} // namespace lanmail::app
