#pragma once

#include <QSet>
#include <QString>

namespace lanmail::storage {

/**
 * FavoritesStore - durable set of favorited peer names.
 *
 * Favorites are a local preference about other peers; they are never
 * announced on the wire.
 */
class FavoritesStore {
public:
    virtual ~FavoritesStore() = default;

    [[nodiscard]] virtual QSet<QString> get() const = 0;
    virtual void set(const QSet<QString>& favorites) = 0;
};

/**
 * Persists favorites in QSettings as a JSON array string.
 */
class SettingsFavoritesStore final : public FavoritesStore {
public:
    static constexpr const char* DEFAULT_KEY = "lanmail/favorites";

    explicit SettingsFavoritesStore(QString key = QString::fromLatin1(DEFAULT_KEY));

    [[nodiscard]] QSet<QString> get() const override;
    void set(const QSet<QString>& favorites) override;

private:
    QString key_;
};

/**
 * Process-lifetime store, for tests and runs that must not touch settings.
 */
class MemoryFavoritesStore final : public FavoritesStore {
public:
    MemoryFavoritesStore() = default;
    explicit MemoryFavoritesStore(QSet<QString> initial) : favorites_(std::move(initial)) {}

    [[nodiscard]] QSet<QString> get() const override { return favorites_; }
    void set(const QSet<QString>& favorites) override { favorites_ = favorites; }

private:
    QSet<QString> favorites_;
};

} // namespace lanmail::storage
