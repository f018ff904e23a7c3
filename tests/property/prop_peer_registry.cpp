#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "network/mail_envelope.hpp"
#include "network/peer_registry.hpp"
#include "network/presence_datagram.hpp"
#include "storage/favorites_store.hpp"

#include <set>

using namespace lanmail;
using namespace lanmail::network;

namespace {

// Small alphabet so generated sequences revisit names often.
rc::Gen<QString> peer_name() {
    return rc::gen::map(rc::gen::inRange(0, 12), [](int i) {
        return QStringLiteral("peer-%1").arg(i);
    });
}

QHostAddress address_for(int octet) {
    return QHostAddress(QStringLiteral("192.168.1.%1").arg(octet));
}

} // namespace

TEST_CASE("Property: registry holds one entry per announced name", "[property][registry]") {
    rc::check("size equals number of distinct names",
        []() {
            const auto announcements = *rc::gen::container<std::vector<std::pair<QString, int>>>(
                rc::gen::pair(peer_name(), rc::gen::inRange(1, 255)));

            storage::MemoryFavoritesStore favorites;
            PeerRegistry registry(favorites);

            std::set<QString> distinct;
            for (const auto& [name, octet] : announcements) {
                registry.upsert(name, address_for(octet));
                distinct.insert(name);
            }

            RC_ASSERT(registry.size() == distinct.size());
            for (const auto& name : distinct) {
                RC_ASSERT(registry.find(name).has_value());
            }
        }
    );
}

TEST_CASE("Property: favorites always precede other peers", "[property][registry]") {
    rc::check("no favorite follows a non-favorite",
        []() {
            const auto names = *rc::gen::container<std::vector<QString>>(peer_name());
            const auto toggles = *rc::gen::container<std::vector<QString>>(peer_name());
            const auto starred = *rc::gen::container<std::vector<QString>>(peer_name());

            storage::MemoryFavoritesStore favorites(QSet<QString>(starred.begin(), starred.end()));
            PeerRegistry registry(favorites);

            for (size_t i = 0; i < names.size(); ++i) {
                registry.upsert(names[i], address_for(static_cast<int>(i % 250) + 1));
            }
            for (const auto& name : toggles) {
                (void)registry.toggle_favorite(name);
            }

            bool seen_plain = false;
            for (const auto& peer : registry.peers()) {
                if (!peer.favorite) {
                    seen_plain = true;
                } else {
                    RC_ASSERT(!seen_plain);
                }
                RC_ASSERT(peer.favorite == favorites.get().contains(peer.name));
            }
        }
    );
}

TEST_CASE("Property: remove_stale drops exactly the expired peers", "[property][registry]") {
    rc::check("survivors were seen within the threshold",
        []() {
            const auto ages = *rc::gen::container<std::vector<int>>(rc::gen::inRange(0, 60000));

            Timestamp clock_now{0};
            storage::MemoryFavoritesStore favorites;
            PeerRegistry registry(favorites, [&clock_now]() { return clock_now; });

            const Timestamp now{100000};
            size_t expected_survivors = 0;
            for (size_t i = 0; i < ages.size(); ++i) {
                clock_now = Timestamp{now.millis() - ages[i]};
                registry.upsert(QStringLiteral("peer-%1").arg(i), address_for(static_cast<int>(i % 250) + 1));
                if (ages[i] < 30000) {
                    ++expected_survivors;
                }
            }

            const auto removed = registry.remove_stale(now);
            RC_ASSERT(static_cast<size_t>(removed) == ages.size() - expected_survivors);
            RC_ASSERT(registry.size() == expected_survivors);
            for (const auto& peer : registry.peers()) {
                RC_ASSERT(now.millis() - peer.last_seen.millis() < 30000);
            }
        }
    );
}

TEST_CASE("Property: decoders never accept arbitrary bytes silently", "[property][codec]") {
    rc::check("decode either fails or yields a usable value",
        [](const std::string& raw) {
            const auto bytes = QByteArray::fromStdString(raw);

            const auto presence = decode_presence_datagram(bytes);
            if (presence.is_ok()) {
                RC_ASSERT(!presence.unwrap().isEmpty());
            }

            const auto envelope = decode_envelope(bytes);
            if (envelope.is_ok() && envelope.unwrap().kind == Envelope::Kind::Mail) {
                RC_ASSERT(envelope.unwrap().mail.has_value());
            }
        }
    );
}
