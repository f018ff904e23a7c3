#include "network/mail_envelope.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>

namespace lanmail::network {
namespace {

constexpr const char* kTypeMail = "mail";
constexpr const char* kTypeShutdown = "shutdown";

QJsonObject to_json(const Mail& mail) {
    QJsonObject obj;
    obj[QStringLiteral("sender_name")] = mail.sender_name;
    obj[QStringLiteral("message")] = mail.message;
    obj[QStringLiteral("node_string")] = mail.node_string;
    obj[QStringLiteral("timestamp")] = mail.timestamp;
    return obj;
}

Result<Envelope> malformed(const char* why) {
    return Result<Envelope>::err(Error{why, ErrorCode::MalformedMessage});
}

} // namespace

QByteArray encode_mail_envelope(const Mail& mail) {
    QJsonObject obj;
    obj[QStringLiteral("type")] = QString::fromLatin1(kTypeMail);
    obj[QStringLiteral("mail")] = to_json(mail);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

QByteArray encode_shutdown_envelope() {
    QJsonObject obj;
    obj[QStringLiteral("type")] = QString::fromLatin1(kTypeShutdown);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<Envelope> decode_envelope(const QByteArray& bytes) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return malformed("invalid json");
    }

    const auto obj = doc.object();
    const auto type = obj.value(QStringLiteral("type")).toString();

    if (type == QString::fromLatin1(kTypeShutdown)) {
        return Result<Envelope>::ok(Envelope{Envelope::Kind::Shutdown, std::nullopt});
    }
    if (type != QString::fromLatin1(kTypeMail)) {
        return malformed("unknown envelope type");
    }

    const auto mail_value = obj.value(QStringLiteral("mail"));
    if (!mail_value.isObject()) {
        return malformed("missing mail");
    }
    const auto m = mail_value.toObject();

    const auto sender = m.value(QStringLiteral("sender_name"));
    const auto message = m.value(QStringLiteral("message"));
    const auto node_string = m.value(QStringLiteral("node_string"));
    const auto timestamp = m.value(QStringLiteral("timestamp"));
    if (!sender.isString() || !message.isString() || !node_string.isString()) {
        return malformed("missing mail fields");
    }
    // JSON numbers arrive as doubles; only whole values are valid timestamps.
    if (!timestamp.isDouble() || std::trunc(timestamp.toDouble()) != timestamp.toDouble()) {
        return malformed("invalid timestamp");
    }

    Mail mail;
    mail.sender_name = sender.toString();
    mail.message = message.toString();
    mail.node_string = node_string.toString();
    mail.timestamp = timestamp.toInteger();

    return Result<Envelope>::ok(Envelope{Envelope::Kind::Mail, std::move(mail)});
}

} // namespace lanmail::network
