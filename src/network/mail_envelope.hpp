#pragma once

#include "core/mail.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <optional>

namespace lanmail::network {

/**
 * Envelope - what arrives on the messaging port once the sender closes.
 *
 * Wire format (JSON, no length prefix; connection close ends the message):
 *   {"type":"mail","mail":{"sender_name":..,"message":..,"node_string":..,"timestamp":..}}
 *   {"type":"shutdown"}
 */
struct Envelope {
    enum class Kind {
        Mail,
        Shutdown
    };

    Kind kind = Kind::Mail;
    std::optional<Mail> mail;
};

QByteArray encode_mail_envelope(const Mail& mail);
QByteArray encode_shutdown_envelope();

/**
 * Decode a complete envelope. Fails with ErrorCode::MalformedMessage.
 */
Result<Envelope> decode_envelope(const QByteArray& bytes);

} // namespace lanmail::network
