#include "network/presence_datagram.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace lanmail::network {

QByteArray encode_presence_datagram(const QString& name) {
    QJsonObject obj;
    obj[QStringLiteral("type")] = QString::fromLatin1(kAnnouncementType);
    obj[QStringLiteral("name")] = name;
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<QString> decode_presence_datagram(const QByteArray& datagram) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(datagram, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<QString>::err(Error{"invalid json", ErrorCode::MalformedDatagram});
    }

    const auto obj = doc.object();
    // Older instances omitted the type; anything else is foreign traffic.
    if (obj.contains(QStringLiteral("type")) &&
        obj.value(QStringLiteral("type")).toString() != QString::fromLatin1(kAnnouncementType)) {
        return Result<QString>::err(Error{"wrong message type", ErrorCode::MalformedDatagram});
    }

    const auto name = obj.value(QStringLiteral("name"));
    if (!name.isString() || name.toString().isEmpty()) {
        return Result<QString>::err(Error{"missing name", ErrorCode::MalformedDatagram});
    }

    return Result<QString>::ok(name.toString());
}

} // namespace lanmail::network
