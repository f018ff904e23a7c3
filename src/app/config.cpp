#include "app/config.hpp"

#include "app/logging.hpp"

#include <QSettings>

namespace lanmail::app {
namespace {

// Applies `raw` to `target` if it parses; otherwise keeps the current value.
template<typename T, typename Parse>
void apply_override(T& target, const QString& raw, const char* source, Parse parse) {
    if (raw.isEmpty()) return;
    auto parsed = parse(raw);
    if (parsed.is_err()) {
        qCWarning(lanmailNodeLog) << "ignoring" << source << ":"
                                  << parsed.unwrap_err().message.c_str();
        return;
    }
    target = parsed.unwrap();
}

} // namespace

Result<quint16> parse_port(const QString& text) {
    bool ok = false;
    const auto value = text.trimmed().toUInt(&ok);
    if (!ok || value == 0 || value > 65535) {
        return Result<quint16>::err(
            Error{"invalid port '" + text.toStdString() + "'", ErrorCode::InvalidConfig});
    }
    return Result<quint16>::ok(static_cast<quint16>(value));
}

Result<int> parse_timeout_ms(const QString& text) {
    bool ok = false;
    const auto value = text.trimmed().toInt(&ok);
    if (!ok || value <= 0) {
        return Result<int>::err(
            Error{"invalid timeout '" + text.toStdString() + "'", ErrorCode::InvalidConfig});
    }
    return Result<int>::ok(value);
}

QString login_name() {
#ifdef Q_OS_WIN
    auto name = qEnvironmentVariable("USERNAME");
#else
    auto name = qEnvironmentVariable("USER");
    if (name.isEmpty()) {
        name = qEnvironmentVariable("LOGNAME");
    }
#endif
    name = name.trimmed();
    return name.isEmpty() ? QStringLiteral("unknown") : name;
}

QString resolve_username() {
    QSettings settings;
    const auto stored = settings.value(QString::fromLatin1(kSettingsUsername)).toString().trimmed();
    return stored.isEmpty() ? login_name() : stored;
}

void save_username(const QString& name) {
    QSettings settings;
    const auto trimmed = name.trimmed();
    if (trimmed.isEmpty()) {
        settings.remove(QString::fromLatin1(kSettingsUsername));
    } else {
        settings.setValue(QString::fromLatin1(kSettingsUsername), trimmed);
    }
}

NodeConfig load_node_config() {
    NodeConfig config;
    config.name = resolve_username();

    QSettings settings;
    apply_override(config.broadcast_port,
                   settings.value(QString::fromLatin1(kSettingsBroadcastPort)).toString(),
                   kSettingsBroadcastPort, parse_port);
    apply_override(config.messaging_port,
                   settings.value(QString::fromLatin1(kSettingsMessagingPort)).toString(),
                   kSettingsMessagingPort, parse_port);

    const auto env_name = qEnvironmentVariable("LANMAIL_NAME").trimmed();
    if (!env_name.isEmpty()) {
        config.name = env_name;
    }
    apply_override(config.broadcast_port, qEnvironmentVariable("LANMAIL_BROADCAST_PORT"),
                   "LANMAIL_BROADCAST_PORT", parse_port);
    apply_override(config.messaging_port, qEnvironmentVariable("LANMAIL_MESSAGING_PORT"),
                   "LANMAIL_MESSAGING_PORT", parse_port);
    apply_override(config.connect_timeout_ms, qEnvironmentVariable("LANMAIL_CONNECT_TIMEOUT_MS"),
                   "LANMAIL_CONNECT_TIMEOUT_MS", parse_timeout_ms);

    return config;
}

} // namespace lanmail::app
