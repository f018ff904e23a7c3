#include <catch2/catch_test_macros.hpp>

#include "network/mail_envelope.hpp"

#include <QJsonDocument>
#include <QJsonObject>

using namespace lanmail;
using namespace lanmail::network;

TEST_CASE("Mail envelope: encode/decode keeps every field", "[envelope]") {
    Mail mail;
    mail.sender_name = QStringLiteral("bob");
    mail.message = QStringLiteral("hi \"there\"\nsecond line");
    mail.node_string = QStringLiteral("set cut_paste_input [stack 0]\nBlur {\n size 3\n}\n");
    mail.timestamp = 1700000000;

    const auto decoded = decode_envelope(encode_mail_envelope(mail));
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().kind == Envelope::Kind::Mail);
    REQUIRE(decoded.unwrap().mail.has_value());
    REQUIRE(*decoded.unwrap().mail == mail);
}

TEST_CASE("Mail envelope: wire shape matches the messaging protocol", "[envelope]") {
    Mail mail{QStringLiteral("bob"), QStringLiteral("hi"), QStringLiteral("xyz"), 1000};

    const auto doc = QJsonDocument::fromJson(encode_mail_envelope(mail));
    REQUIRE(doc.isObject());
    const auto obj = doc.object();
    REQUIRE(obj.value(QStringLiteral("type")).toString() == QStringLiteral("mail"));

    const auto inner = obj.value(QStringLiteral("mail")).toObject();
    REQUIRE(inner.value(QStringLiteral("sender_name")).toString() == QStringLiteral("bob"));
    REQUIRE(inner.value(QStringLiteral("message")).toString() == QStringLiteral("hi"));
    REQUIRE(inner.value(QStringLiteral("node_string")).toString() == QStringLiteral("xyz"));
    REQUIRE(inner.value(QStringLiteral("timestamp")).toInteger() == 1000);
}

TEST_CASE("Mail envelope: decodes hand-written mail json", "[envelope]") {
    const auto bytes = QByteArrayLiteral(
        R"({"type":"mail","mail":{"sender_name":"bob","message":"hi","node_string":"xyz","timestamp":1000}})");

    const auto decoded = decode_envelope(bytes);
    REQUIRE(decoded.is_ok());
    REQUIRE(*decoded.unwrap().mail ==
            Mail{QStringLiteral("bob"), QStringLiteral("hi"), QStringLiteral("xyz"), 1000});
}

TEST_CASE("Mail envelope: shutdown has no mail", "[envelope]") {
    REQUIRE(encode_shutdown_envelope() == QByteArrayLiteral(R"({"type":"shutdown"})"));

    const auto decoded = decode_envelope(encode_shutdown_envelope());
    REQUIRE(decoded.is_ok());
    REQUIRE(decoded.unwrap().kind == Envelope::Kind::Shutdown);
    REQUIRE_FALSE(decoded.unwrap().mail.has_value());
}

TEST_CASE("Mail envelope: rejects malformed input", "[envelope]") {
    const QByteArray cases[] = {
        QByteArrayLiteral("not json"),
        QByteArrayLiteral(""),
        QByteArrayLiteral("[1,2,3]"),
        QByteArrayLiteral(R"({"type":"parcel"})"),
        QByteArrayLiteral(R"({"type":"mail"})"),
        QByteArrayLiteral(R"({"type":"mail","mail":{"sender_name":"bob","message":"hi","timestamp":1}})"),
        QByteArrayLiteral(R"({"type":"mail","mail":{"sender_name":"bob","message":"hi","node_string":"x","timestamp":"1"}})"),
        QByteArrayLiteral(R"({"type":"mail","mail":{"sender_name":"bob","message":"hi","node_string":"x","timestamp":1.5}})"),
        QByteArrayLiteral(R"({"type":"mail","mail":{"sender_name":"bob","message":"hi","node_string":"x","timestamp":1000})"),
    };

    for (const auto& bytes : cases) {
        INFO(bytes.toStdString());
        const auto decoded = decode_envelope(bytes);
        REQUIRE(decoded.is_err());
        REQUIRE(decoded.unwrap_err().code == ErrorCode::MalformedMessage);
    }
}
