#include <catch2/catch_test_macros.hpp>

#include "network/peer_registry.hpp"
#include "network/presence_datagram.hpp"
#include "network/presence_listener.hpp"
#include "storage/favorites_store.hpp"

using namespace lanmail;
using namespace lanmail::network;

namespace {

const QHostAddress kSelf(QStringLiteral("10.0.0.2"));

} // namespace

TEST_CASE("PresenceListener: announcement from another host registers a peer", "[listener]") {
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites);
    PresenceListener listener(registry);
    listener.setLocalAddresses({kSelf});

    const auto datagram = QByteArrayLiteral(R"({"type":"node_mailer_instance","name":"alice"})");
    REQUIRE(listener.handleDatagram(datagram, QHostAddress(QStringLiteral("10.0.0.5"))));

    REQUIRE(registry.size() == 1);
    const auto& peer = registry.peers().front();
    REQUIRE(peer.name == QStringLiteral("alice"));
    REQUIRE(peer.address == QHostAddress(QStringLiteral("10.0.0.5")));
    REQUIRE_FALSE(peer.favorite);
}

TEST_CASE("PresenceListener: own announcements are suppressed", "[listener]") {
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites);
    PresenceListener listener(registry);
    listener.setLocalAddresses({kSelf, QHostAddress(QStringLiteral("192.168.1.20"))});

    const auto datagram = encode_presence_datagram(QStringLiteral("me"));
    REQUIRE_FALSE(listener.handleDatagram(datagram, kSelf));
    REQUIRE_FALSE(listener.handleDatagram(datagram, QHostAddress(QStringLiteral("192.168.1.20"))));
    REQUIRE_FALSE(listener.handleDatagram(datagram, QHostAddress(QStringLiteral("::ffff:10.0.0.2"))));
    REQUIRE(registry.size() == 0);

    SECTION("a suppressed address never refreshes an existing peer") {
        REQUIRE(listener.handleDatagram(datagram, QHostAddress(QStringLiteral("10.0.0.7"))));
        const auto before = registry.find(QStringLiteral("me"))->address;
        REQUIRE_FALSE(listener.handleDatagram(datagram, kSelf));
        REQUIRE(registry.find(QStringLiteral("me"))->address == before);
    }
}

TEST_CASE("PresenceListener: malformed and foreign datagrams are ignored", "[listener]") {
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites);
    PresenceListener listener(registry);
    listener.setLocalAddresses({kSelf});

    const QHostAddress other(QStringLiteral("10.0.0.5"));
    REQUIRE_FALSE(listener.handleDatagram(QByteArrayLiteral("randomnonjsonstring"), other));
    REQUIRE_FALSE(listener.handleDatagram(QByteArrayLiteral(R"({"test":"test"})"), other));
    REQUIRE_FALSE(listener.handleDatagram(QByteArrayLiteral(R"({"type":"file_share_instance","name":"x"})"), other));
    REQUIRE_FALSE(listener.handleDatagram(QByteArrayLiteral(R"({"name":42})"), other));
    REQUIRE(registry.size() == 0);
}

TEST_CASE("PresenceListener: v4-mapped senders are stored as plain IPv4", "[listener]") {
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites);
    PresenceListener listener(registry);
    listener.setLocalAddresses({});

    REQUIRE(listener.handleDatagram(encode_presence_datagram(QStringLiteral("alice")),
                                    QHostAddress(QStringLiteral("::ffff:10.0.0.5"))));
    REQUIRE(registry.find(QStringLiteral("alice"))->address == QHostAddress(QStringLiteral("10.0.0.5")));
}

TEST_CASE("PresenceListener: local address enumeration is IPv4 without loopback", "[listener]") {
    for (const auto& address : PresenceListener::enumerateLocalAddresses()) {
        REQUIRE(address.protocol() == QAbstractSocket::IPv4Protocol);
        REQUIRE_FALSE(address.isLoopback());
    }
}
