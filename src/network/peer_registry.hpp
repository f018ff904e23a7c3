#pragma once

#include "core/peer.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "storage/favorites_store.hpp"

#include <QHostAddress>
#include <QObject>
#include <QString>
#include <chrono>
#include <optional>
#include <vector>

namespace lanmail::network {

/**
 * PeerRegistry - the set of peers currently known to be alive.
 *
 * Holds at most one Peer per name, in display order: favorites first, and
 * otherwise in order of first observation. Only touched from the event-loop
 * thread.
 */
class PeerRegistry : public QObject {
    Q_OBJECT

public:
    static constexpr std::chrono::milliseconds DEFAULT_STALE_THRESHOLD{30000};

    /**
     * @param favorites Store consulted for new peers and updated on toggle;
     *                  must outlive the registry.
     * @param clock     Source of "now"; defaults to the monotonic clock.
     */
    explicit PeerRegistry(storage::FavoritesStore& favorites,
                          ClockFn clock = {},
                          QObject* parent = nullptr);
    ~PeerRegistry() override;

    /**
     * Record a presence observation. Updates address and last_seen of an
     * existing peer, or inserts a new one with its persisted favorite flag.
     */
    Peer upsert(const QString& name, const QHostAddress& address);

    /**
     * Drop every peer with now - last_seen >= threshold.
     * @return Number of peers removed.
     */
    int remove_stale(Timestamp now, std::chrono::milliseconds threshold = DEFAULT_STALE_THRESHOLD);

    /**
     * Flip the favorite flag of a peer and persist the new favorite set.
     * Fails with ErrorCode::PeerNotFound for unknown names.
     */
    Result<Peer> toggle_favorite(const QString& name);

    [[nodiscard]] std::optional<Peer> find(const QString& name) const;

    void clear();

    [[nodiscard]] const std::vector<Peer>& peers() const { return peers_; }
    [[nodiscard]] size_t size() const { return peers_.size(); }
    [[nodiscard]] Timestamp now() const { return clock_(); }

signals:
    void peersChanged();

private:
    storage::FavoritesStore& favorites_;
    ClockFn clock_;
    std::vector<Peer> peers_;

    std::vector<Peer>::iterator find_it(const QString& name);
    void sort_by_favorites();
};

} // namespace lanmail::network
