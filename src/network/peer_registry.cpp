#include "network/peer_registry.hpp"

#include "app/logging.hpp"

#include <algorithm>

namespace lanmail::network {

PeerRegistry::PeerRegistry(storage::FavoritesStore& favorites,
                           ClockFn clock,
                           QObject* parent)
    : QObject(parent)
    , favorites_(favorites)
    , clock_(clock ? std::move(clock) : ClockFn(&Timestamp::now))
{
}

PeerRegistry::~PeerRegistry() = default;

std::vector<Peer>::iterator PeerRegistry::find_it(const QString& name) {
    return std::find_if(peers_.begin(), peers_.end(),
        [&](const Peer& p) { return p.name == name; });
}

Peer PeerRegistry::upsert(const QString& name, const QHostAddress& address) {
    const auto now = clock_();

    auto it = find_it(name);
    if (it != peers_.end()) {
        const bool moved = it->address != address;
        it->address = address;
        it->last_seen = now;
        Peer updated = *it;
        if (moved) {
            qCInfo(lanmailDiscoveryLog) << "peer" << name << "moved to" << address.toString();
            emit peersChanged();
        }
        return updated;
    }

    Peer peer;
    peer.name = name;
    peer.address = address;
    peer.favorite = favorites_.get().contains(name);
    peer.last_seen = now;

    peers_.push_back(peer);
    sort_by_favorites();

    qCInfo(lanmailDiscoveryLog) << "peer discovered" << name << "at" << address.toString()
                                << (peer.favorite ? "(favorite)" : "");
    emit peersChanged();
    return peer;
}

int PeerRegistry::remove_stale(Timestamp now, std::chrono::milliseconds threshold) {
    const auto before = peers_.size();
    std::erase_if(peers_, [&](const Peer& p) {
        if (now - p.last_seen >= threshold) {
            qCInfo(lanmailDiscoveryLog) << "peer expired" << p.name;
            return true;
        }
        return false;
    });

    const auto removed = static_cast<int>(before - peers_.size());
    if (removed > 0) {
        emit peersChanged();
    }
    return removed;
}

Result<Peer> PeerRegistry::toggle_favorite(const QString& name) {
    auto it = find_it(name);
    if (it == peers_.end()) {
        return Result<Peer>::err(
            Error{"no peer named '" + name.toStdString() + "'", ErrorCode::PeerNotFound});
    }

    it->favorite = !it->favorite;
    const Peer toggled = *it;

    auto stored = favorites_.get();
    if (toggled.favorite) {
        stored.insert(name);
    } else {
        stored.remove(name);
    }
    favorites_.set(stored);

    sort_by_favorites();
    emit peersChanged();
    return Result<Peer>::ok(toggled);
}

std::optional<Peer> PeerRegistry::find(const QString& name) const {
    auto it = std::find_if(peers_.begin(), peers_.end(),
        [&](const Peer& p) { return p.name == name; });
    if (it != peers_.end()) {
        return *it;
    }
    return std::nullopt;
}

void PeerRegistry::clear() {
    if (peers_.empty()) return;
    peers_.clear();
    emit peersChanged();
}

void PeerRegistry::sort_by_favorites() {
    std::stable_sort(peers_.begin(), peers_.end(),
        [](const Peer& a, const Peer& b) { return a.favorite && !b.favorite; });
}

} // namespace lanmail::network
