#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

#include "app/config.hpp"
#include "app/logging.hpp"
#include "app/mail_node.hpp"
#include "network/message_sender.hpp"
#include "network/peer_registry.hpp"
#include "network/presence_listener.hpp"
#include "storage/favorites_store.hpp"

#include <algorithm>

namespace {

void print_peers(const std::vector<lanmail::Peer>& peers) {
    QTextStream out(stdout);
    if (peers.empty()) {
        out << "no peers\n";
        return;
    }
    for (const auto& peer : peers) {
        out << (peer.favorite ? "* " : "  ") << peer.name << '\t' << peer.address.toString() << '\n';
    }
}

void print_error(const lanmail::Error& error) {
    QTextStream(stderr) << lanmail::to_string(error.code) << ": "
                        << QString::fromStdString(error.message) << '\n';
}

void print_mail(const lanmail::Mail& mail) {
    const auto when = QDateTime::fromSecsSinceEpoch(mail.timestamp).toString(Qt::ISODate);
    QTextStream out(stdout);
    out << "From " << mail.sender_name << " at " << when << ": " << mail.message << '\n';
    if (!mail.node_string.isEmpty()) {
        out << "  (" << mail.node_string.size() << " characters of node data)\n";
    }
}

int run_node(QCoreApplication& app, const lanmail::app::NodeConfig& config) {
    lanmail::app::install_file_logging();
    qInfo() << "lanmail: logging to" << lanmail::app::default_log_file_path();

    lanmail::storage::SettingsFavoritesStore favorites;
    lanmail::app::MailNode node(config, favorites);

    QObject::connect(&node, &lanmail::app::MailNode::error, &app, [](const QString& msg) {
        QTextStream(stderr) << msg << '\n';
    });
    QObject::connect(&node, &lanmail::app::MailNode::mailReceived, &app, &print_mail);
    QObject::connect(&node, &lanmail::app::MailNode::peersChanged, &app, [&node]() {
        print_peers(node.registry().peers());
    });
    QObject::connect(&node, &lanmail::app::MailNode::shutdownRequested,
                     &app, &QCoreApplication::quit, Qt::QueuedConnection);

    if (!node.start()) {
        return 1;
    }
    return app.exec();
}

int send_mail(const QCommandLineParser& parser,
              const QCommandLineOption& toOption,
              const QCommandLineOption& messageOption,
              const QCommandLineOption& payloadOption,
              const lanmail::app::NodeConfig& config) {
    if (!parser.isSet(toOption)) {
        QTextStream(stderr) << "send: --to is required\n";
        return 2;
    }

    QString node_string;
    if (parser.isSet(payloadOption)) {
        QFile file(parser.value(payloadOption));
        if (!file.open(QIODevice::ReadOnly)) {
            QTextStream(stderr) << "send: cannot read " << file.fileName() << ": "
                                << file.errorString() << '\n';
            return 2;
        }
        node_string = QString::fromUtf8(file.readAll());
    }

    lanmail::Mail mail;
    mail.sender_name = config.name;
    mail.message = parser.value(messageOption);
    mail.node_string = node_string;
    mail.timestamp = lanmail::unix_time_seconds();

    const lanmail::network::MessageSender sender(config.connect_timeout_ms);
    const auto sent = sender.send_mail(mail, parser.value(toOption), config.messaging_port);
    if (sent.is_err()) {
        print_error(sent.unwrap_err());
        return 1;
    }
    return 0;
}

int list_peers(QCoreApplication& app, const lanmail::app::NodeConfig& config, int wait_ms) {
    lanmail::storage::SettingsFavoritesStore favorites;
    lanmail::network::PeerRegistry registry(favorites);
    lanmail::network::PresenceListener listener(registry);

    const auto started = listener.start(config.broadcast_port);
    if (started.is_err()) {
        print_error(started.unwrap_err());
        return 1;
    }

    QTimer::singleShot(wait_ms, &app, &QCoreApplication::quit);
    app.exec();

    print_peers(registry.peers());
    return 0;
}

int toggle_favorite(const QString& name) {
    lanmail::storage::SettingsFavoritesStore favorites;
    auto stored = favorites.get();
    const bool now_favorite = !stored.contains(name);
    if (now_favorite) {
        stored.insert(name);
    } else {
        stored.remove(name);
    }
    favorites.set(stored);

    QTextStream(stdout) << name << (now_favorite ? " is now a favorite\n" : " is no longer a favorite\n");
    return 0;
}

int list_favorites() {
    const lanmail::storage::SettingsFavoritesStore favorites;
    const auto stored = favorites.get();
    QStringList names(stored.begin(), stored.end());
    std::sort(names.begin(), names.end());

    QTextStream out(stdout);
    for (const auto& name : names) {
        out << name << '\n';
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanmail");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("lanmail");
    app.setOrganizationDomain("lanmail.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Send node mail to other instances on the LAN"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Identity to announce and sign mail with (overrides settings and LANMAIL_NAME)."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption setNameOption(
        QStringList{QStringLiteral("set-name")},
        QStringLiteral("Persist a custom username (empty restores the login name) and exit."),
        QStringLiteral("name"));
    parser.addOption(setNameOption);

    const QCommandLineOption broadcastPortOption(
        QStringList{QStringLiteral("broadcast-port")},
        QStringLiteral("UDP presence port."),
        QStringLiteral("port"));
    parser.addOption(broadcastPortOption);

    const QCommandLineOption messagingPortOption(
        QStringList{QStringLiteral("messaging-port")},
        QStringLiteral("TCP mail port."),
        QStringLiteral("port"));
    parser.addOption(messagingPortOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("timeout")},
        QStringLiteral("Connect timeout for outgoing mail in milliseconds."),
        QStringLiteral("ms"));
    parser.addOption(timeoutOption);

    const QCommandLineOption toOption(
        QStringList{QStringLiteral("to")},
        QStringLiteral("Host to mail for 'send'."),
        QStringLiteral("host"));
    parser.addOption(toOption);

    const QCommandLineOption messageOption(
        QStringList{QStringLiteral("message")},
        QStringLiteral("Message text for 'send'."),
        QStringLiteral("text"));
    parser.addOption(messageOption);

    const QCommandLineOption payloadOption(
        QStringList{QStringLiteral("payload-file")},
        QStringLiteral("File whose contents are sent as node data for 'send'."),
        QStringLiteral("path"));
    parser.addOption(payloadOption);

    const QCommandLineOption waitOption(
        QStringList{QStringLiteral("wait")},
        QStringLiteral("How long 'peers' listens, in milliseconds (default 5000)."),
        QStringLiteral("ms"),
        QStringLiteral("5000"));
    parser.addOption(waitOption);

    const QCommandLineOption debugDiscoveryOption(
        QStringList{QStringLiteral("debug-discovery")},
        QStringLiteral("Enable discovery debug logging (also sets LANMAIL_DEBUG_DISCOVERY=1)."));
    parser.addOption(debugDiscoveryOption);

    const QCommandLineOption debugMessagingOption(
        QStringList{QStringLiteral("debug-messaging")},
        QStringLiteral("Enable messaging debug logging (also sets LANMAIL_DEBUG_MESSAGING=1)."));
    parser.addOption(debugMessagingOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("run (default), send, shutdown, peers, favorite <name>, favorites"));
    parser.process(app);

    if (parser.isSet(debugDiscoveryOption)) {
        qputenv("LANMAIL_DEBUG_DISCOVERY", "1");
    }
    if (parser.isSet(debugMessagingOption)) {
        qputenv("LANMAIL_DEBUG_MESSAGING", "1");
    }
    lanmail::app::enable_debug_categories(qEnvironmentVariableIsSet("LANMAIL_DEBUG_DISCOVERY"),
                                          qEnvironmentVariableIsSet("LANMAIL_DEBUG_MESSAGING"));

    if (parser.isSet(setNameOption)) {
        lanmail::app::save_username(parser.value(setNameOption));
        QTextStream(stdout) << "username: " << lanmail::app::resolve_username() << '\n';
        return 0;
    }

    auto config = lanmail::app::load_node_config();
    if (parser.isSet(nameOption) && !parser.value(nameOption).trimmed().isEmpty()) {
        config.name = parser.value(nameOption).trimmed();
    }

    struct PortFlag {
        const QCommandLineOption& option;
        quint16& target;
    };
    for (const auto& flag : {PortFlag{broadcastPortOption, config.broadcast_port},
                             PortFlag{messagingPortOption, config.messaging_port}}) {
        if (!parser.isSet(flag.option)) continue;
        auto port = lanmail::app::parse_port(parser.value(flag.option));
        if (port.is_err()) {
            print_error(port.unwrap_err());
            return 2;
        }
        flag.target = port.unwrap();
    }

    if (parser.isSet(timeoutOption)) {
        auto timeout = lanmail::app::parse_timeout_ms(parser.value(timeoutOption));
        if (timeout.is_err()) {
            print_error(timeout.unwrap_err());
            return 2;
        }
        config.connect_timeout_ms = timeout.unwrap();
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("run") : positional.first();

    if (command == QStringLiteral("run")) {
        return run_node(app, config);
    }

    if (command == QStringLiteral("send")) {
        return send_mail(parser, toOption, messageOption, payloadOption, config);
    }

    if (command == QStringLiteral("shutdown")) {
        lanmail::network::MessageSender(config.connect_timeout_ms).send_shutdown(config.messaging_port);
        return 0;
    }

    if (command == QStringLiteral("peers")) {
        auto wait = lanmail::app::parse_timeout_ms(parser.value(waitOption));
        if (wait.is_err()) {
            print_error(wait.unwrap_err());
            return 2;
        }
        return list_peers(app, config, wait.unwrap());
    }

    if (command == QStringLiteral("favorite")) {
        if (positional.size() < 2 || positional.at(1).trimmed().isEmpty()) {
            QTextStream(stderr) << "favorite: a peer name is required\n";
            return 2;
        }
        return toggle_favorite(positional.at(1).trimmed());
    }

    if (command == QStringLiteral("favorites")) {
        return list_favorites();
    }

    QTextStream(stderr) << "unknown command '" << command << "'\n";
    parser.showHelp(2);
}
