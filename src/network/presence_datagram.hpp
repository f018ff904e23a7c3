#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <QString>

namespace lanmail::network {

// Presence announcement helpers (used by PresenceBroadcaster/PresenceListener).
// Kept separate so encode/decode can be tested without sockets.

inline constexpr const char* kAnnouncementType = "node_mailer_instance";

QByteArray encode_presence_datagram(const QString& name);

/**
 * Decode an announcement and return the announced name.
 * Fails with ErrorCode::MalformedDatagram on anything else.
 */
Result<QString> decode_presence_datagram(const QByteArray& datagram);

} // namespace lanmail::network
