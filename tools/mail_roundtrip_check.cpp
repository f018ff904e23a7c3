#include <QCoreApplication>
#include <QEventLoop>
#include <QHostAddress>
#include <QTimer>

#include "app/mail_node.hpp"
#include "network/peer_registry.hpp"
#include "network/presence_listener.hpp"
#include "storage/favorites_store.hpp"

// Starts two nodes on loopback, lets A discover B through a synthetic
// announcement, mails B by name and waits for delivery. Exit code 0 on success.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    lanmail::app::enable_debug_categories(true, true);

    lanmail::app::NodeConfig configA;
    configA.name = QStringLiteral("A");
    configA.messaging_port = 0;
    configA.broadcast_port = 0;
    configA.broadcast_address = QHostAddress(QHostAddress::LocalHost);

    lanmail::app::NodeConfig configB = configA;
    configB.name = QStringLiteral("B");

    lanmail::storage::MemoryFavoritesStore favoritesA;
    lanmail::storage::MemoryFavoritesStore favoritesB;
    lanmail::app::MailNode a(configA, favoritesA);
    lanmail::app::MailNode b(configB, favoritesB);

    QObject::connect(&a, &lanmail::app::MailNode::error, &app, [&](const QString &msg) {
        qCritical().noquote() << "A error:" << msg;
    });
    QObject::connect(&b, &lanmail::app::MailNode::error, &app, [&](const QString &msg) {
        qCritical().noquote() << "B error:" << msg;
    });

    if (!a.start()) {
        return 1;
    }
    if (!b.start()) {
        return 1;
    }

    // Loopback is not a "local address" for self-suppression, so this is
    // accepted as a foreign announcement from B.
    a.listener().handleDatagram(QByteArrayLiteral(R"({"type":"node_mailer_instance","name":"B"})"),
                                QHostAddress(QHostAddress::LocalHost));
    if (!a.registry().find(QStringLiteral("B"))) {
        qCritical() << "A did not register B";
        return 2;
    }

    bool delivered = false;
    QObject::connect(&b, &lanmail::app::MailNode::mailReceived, &app, [&](const lanmail::Mail &mail) {
        delivered = mail.sender_name == QStringLiteral("A") && mail.message == QStringLiteral("ping");
    });

    // B listens on an ephemeral port, so the port is passed explicitly.
    const auto sent = a.sendMailTo(a.registry().find(QStringLiteral("B"))->address.toString(),
                                   b.messagingPort(), QStringLiteral("ping"), QStringLiteral("node-data"));
    if (sent.is_err()) {
        qCritical() << "send failed:" << sent.unwrap_err().message.c_str();
        return 3;
    }

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(3000);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (delivered) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();

    return delivered ? 0 : 4;
}
