#pragma once

#include "app/config.hpp"
#include "core/mail.hpp"
#include "core/peer.hpp"
#include "core/result.hpp"
#include "network/message_sender.hpp"

#include <QObject>
#include <QString>
#include <memory>

namespace lanmail::storage {
class FavoritesStore;
}

namespace lanmail::network {
class PeerRegistry;
class PresenceBroadcaster;
class PresenceListener;
class MessageServer;
}

namespace lanmail::app {

/**
 * MailNode - one running instance: discovery plus the mail endpoint.
 *
 * Owns the registry, both presence halves and the message server, and
 * re-exposes their events so an application layer only has to talk to this.
 */
class MailNode : public QObject {
    Q_OBJECT

public:
    /**
     * @param favorites Must outlive the node.
     */
    MailNode(NodeConfig config, storage::FavoritesStore& favorites, QObject* parent = nullptr);
    ~MailNode() override;

    /**
     * Bind both ports and start announcing. Emits error() and returns false
     * if either port cannot be bound; nothing is left running in that case.
     */
    bool start();
    void stop();

    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * Send a mail to a discovered peer by name.
     * Fails with PeerNotFound or ConnectionError.
     */
    Result<void> sendMail(const QString& peer_name, const QString& message, const QString& node_string);

    /**
     * Send a mail to an explicit host:port, bypassing discovery.
     */
    Result<void> sendMailTo(const QString& host, quint16 port,
                            const QString& message, const QString& node_string);

    Result<Peer> toggleFavorite(const QString& peer_name);

    [[nodiscard]] Mail composeMail(const QString& message, const QString& node_string) const;

    [[nodiscard]] const NodeConfig& config() const { return config_; }
    [[nodiscard]] network::PeerRegistry& registry() { return *registry_; }
    [[nodiscard]] const network::PeerRegistry& registry() const { return *registry_; }
    [[nodiscard]] network::PresenceListener& listener() { return *listener_; }
    [[nodiscard]] quint16 messagingPort() const;
    [[nodiscard]] quint16 presencePort() const;

signals:
    void mailReceived(const lanmail::Mail& mail);
    void shutdownRequested();
    void peersChanged();
    void error(const QString& message);

private:
    NodeConfig config_;
    std::unique_ptr<network::PeerRegistry> registry_;
    std::unique_ptr<network::PresenceBroadcaster> broadcaster_;
    std::unique_ptr<network::PresenceListener> listener_;
    std::unique_ptr<network::MessageServer> server_;
    network::MessageSender sender_;
    bool running_ = false;
};

} // namespace lanmail::app
