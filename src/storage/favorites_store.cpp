#include "storage/favorites_store.hpp"

#include "app/logging.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSettings>
#include <QStringList>
#include <algorithm>

namespace lanmail::storage {

SettingsFavoritesStore::SettingsFavoritesStore(QString key)
    : key_(std::move(key))
{
}

QSet<QString> SettingsFavoritesStore::get() const {
    QSettings settings;
    const auto raw = settings.value(key_, QStringLiteral("[]")).toString();

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(raw.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        qCWarning(lanmailNodeLog) << "ignoring unreadable favorites setting" << key_
                                  << err.errorString();
        return {};
    }

    QSet<QString> out;
    for (const auto& value : doc.array()) {
        if (value.isString()) {
            out.insert(value.toString());
        }
    }
    return out;
}

void SettingsFavoritesStore::set(const QSet<QString>& favorites) {
    // Sorted so the stored value is stable between writes.
    QStringList names(favorites.begin(), favorites.end());
    std::sort(names.begin(), names.end());

    QSettings settings;
    settings.setValue(key_, QString::fromUtf8(
        QJsonDocument(QJsonArray::fromStringList(names)).toJson(QJsonDocument::Compact)));
}

} // namespace lanmail::storage
