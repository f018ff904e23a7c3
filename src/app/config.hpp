#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QString>
#include <QtGlobal>

namespace lanmail::app {

/**
 * NodeConfig - everything a MailNode needs to start.
 *
 * Resolution order per field: command line > environment > QSettings > default.
 * The command line layer is applied by the caller on top of load_node_config().
 */
struct NodeConfig {
    QString name;
    quint16 broadcast_port = 37220;
    quint16 messaging_port = 37221;
    QHostAddress broadcast_address{QHostAddress::Broadcast};
    int broadcast_interval_ms = 2000;
    int stale_check_interval_ms = 30000;
    int stale_threshold_ms = 30000;
    int connect_timeout_ms = 500;
};

inline constexpr const char* kSettingsUsername = "lanmail/username";
inline constexpr const char* kSettingsBroadcastPort = "lanmail/broadcast_port";
inline constexpr const char* kSettingsMessagingPort = "lanmail/messaging_port";

/**
 * Parse a TCP/UDP port in 1..65535. Fails with ErrorCode::InvalidConfig.
 */
[[nodiscard]] Result<quint16> parse_port(const QString& text);

/**
 * Parse a positive millisecond duration. Fails with ErrorCode::InvalidConfig.
 */
[[nodiscard]] Result<int> parse_timeout_ms(const QString& text);

/**
 * The OS login name, or "unknown".
 */
[[nodiscard]] QString login_name();

/**
 * The stored custom username, falling back to the login name.
 */
[[nodiscard]] QString resolve_username();

/**
 * Persist a custom username; an empty name removes the override.
 */
void save_username(const QString& name);

[[nodiscard]] NodeConfig load_node_config();

} // namespace lanmail::app
