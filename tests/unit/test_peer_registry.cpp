#include <catch2/catch_test_macros.hpp>

#include "network/peer_registry.hpp"
#include "storage/favorites_store.hpp"

#include <QSignalSpy>

using namespace lanmail;
using namespace lanmail::network;
using namespace std::chrono_literals;

namespace {

struct FakeClock {
    Timestamp now{1'000'000};

    ClockFn fn() {
        return [this]() { return now; };
    }
};

QStringList names(const PeerRegistry& registry) {
    QStringList out;
    for (const auto& peer : registry.peers()) {
        out << peer.name;
    }
    return out;
}

} // namespace

TEST_CASE("PeerRegistry: upsert inserts one peer per name", "[registry]") {
    FakeClock clock;
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites, clock.fn());

    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));
    registry.upsert(QStringLiteral("bob"), QHostAddress(QStringLiteral("10.0.0.6")));

    REQUIRE(registry.size() == 2);

    SECTION("re-observing updates address and last_seen in place") {
        clock.now = clock.now + 5s;
        registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.9")));

        REQUIRE(registry.size() == 2);
        const auto alice = registry.find(QStringLiteral("alice"));
        REQUIRE(alice.has_value());
        REQUIRE(alice->address == QHostAddress(QStringLiteral("10.0.0.9")));
        REQUIRE(alice->last_seen == clock.now);
        REQUIRE(names(registry) == QStringList{QStringLiteral("alice"), QStringLiteral("bob")});
    }

    SECTION("find is exact match") {
        REQUIRE_FALSE(registry.find(QStringLiteral("Alice")).has_value());
        REQUIRE_FALSE(registry.find(QStringLiteral("carol")).has_value());
    }
}

TEST_CASE("PeerRegistry: new peers take their favorite flag from the store", "[registry]") {
    storage::MemoryFavoritesStore favorites(QSet<QString>{QStringLiteral("carol")});
    PeerRegistry registry(favorites);

    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));
    registry.upsert(QStringLiteral("bob"), QHostAddress(QStringLiteral("10.0.0.6")));
    const auto carol = registry.upsert(QStringLiteral("carol"), QHostAddress(QStringLiteral("10.0.0.7")));

    REQUIRE(carol.favorite);
    REQUIRE(names(registry) ==
            QStringList{QStringLiteral("carol"), QStringLiteral("alice"), QStringLiteral("bob")});
}

TEST_CASE("PeerRegistry: remove_stale boundary is inclusive at the threshold", "[registry]") {
    FakeClock clock;
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites, clock.fn());

    const auto start = clock.now;
    registry.upsert(QStringLiteral("old"), QHostAddress(QStringLiteral("10.0.0.1")));
    clock.now = start + 1ms;
    registry.upsert(QStringLiteral("young"), QHostAddress(QStringLiteral("10.0.0.2")));

    // old: exactly 30s, young: 29.999s
    REQUIRE(registry.remove_stale(start + 30s) == 1);
    REQUIRE(names(registry) == QStringList{QStringLiteral("young")});

    REQUIRE(registry.remove_stale(start + 30s + 1ms) == 1);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("PeerRegistry: remove_stale honours a custom threshold", "[registry]") {
    FakeClock clock;
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites, clock.fn());

    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));

    REQUIRE(registry.remove_stale(clock.now + 5s, 10s) == 0);
    REQUIRE(registry.remove_stale(clock.now + 10s, 10s) == 1);
}

TEST_CASE("PeerRegistry: toggle_favorite persists and re-sorts", "[registry]") {
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites);

    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));
    registry.upsert(QStringLiteral("bob"), QHostAddress(QStringLiteral("10.0.0.6")));
    registry.upsert(QStringLiteral("carol"), QHostAddress(QStringLiteral("10.0.0.7")));

    auto toggled = registry.toggle_favorite(QStringLiteral("carol"));
    REQUIRE(toggled.is_ok());
    REQUIRE(toggled.unwrap().favorite);
    REQUIRE(favorites.get().contains(QStringLiteral("carol")));
    REQUIRE(names(registry) ==
            QStringList{QStringLiteral("carol"), QStringLiteral("alice"), QStringLiteral("bob")});

    SECTION("toggling back restores a non-favorite and clears the store") {
        auto again = registry.toggle_favorite(QStringLiteral("carol"));
        REQUIRE(again.is_ok());
        REQUIRE_FALSE(again.unwrap().favorite);
        REQUIRE(favorites.get().isEmpty());
        // Stable: carol keeps its current position among non-favorites.
        REQUIRE(names(registry) ==
                QStringList{QStringLiteral("carol"), QStringLiteral("alice"), QStringLiteral("bob")});
    }

    SECTION("a second favorite keeps relative order within the favorite group") {
        REQUIRE(registry.toggle_favorite(QStringLiteral("bob")).is_ok());
        REQUIRE(names(registry) ==
                QStringList{QStringLiteral("carol"), QStringLiteral("bob"), QStringLiteral("alice")});
    }
}

TEST_CASE("PeerRegistry: toggle_favorite on unknown name fails with PeerNotFound", "[registry]") {
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites);
    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));

    auto result = registry.toggle_favorite(QStringLiteral("mallory"));
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().code == ErrorCode::PeerNotFound);
    REQUIRE(favorites.get().isEmpty());
    REQUIRE(registry.size() == 1);
}

TEST_CASE("PeerRegistry: peersChanged fires on membership changes only", "[registry]") {
    FakeClock clock;
    storage::MemoryFavoritesStore favorites;
    PeerRegistry registry(favorites, clock.fn());
    QSignalSpy spy(&registry, &PeerRegistry::peersChanged);
    REQUIRE(spy.isValid());

    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));
    REQUIRE(spy.count() == 1);

    // Heartbeat from the same address.
    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.5")));
    REQUIRE(spy.count() == 1);

    registry.upsert(QStringLiteral("alice"), QHostAddress(QStringLiteral("10.0.0.8")));
    REQUIRE(spy.count() == 2);

    REQUIRE(registry.remove_stale(clock.now + 1s) == 0);
    REQUIRE(spy.count() == 2);

    registry.clear();
    REQUIRE(spy.count() == 3);
    REQUIRE(registry.size() == 0);
}
