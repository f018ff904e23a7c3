#pragma once

#include "core/mail.hpp"
#include "core/result.hpp"

#include <QHostAddress>
#include <QString>

namespace lanmail::network {

/**
 * MessageSender - delivers one envelope per TCP connection.
 *
 * Deliberately synchronous: sending is a user action and every wait is
 * bounded. The receiver treats connection close as end-of-message, so every
 * successful send ends with an explicit close.
 */
class MessageSender {
public:
    static constexpr int DEFAULT_CONNECT_TIMEOUT_MS = 500;
    static constexpr int DEFAULT_WRITE_TIMEOUT_MS = 5000;

    explicit MessageSender(int connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS,
                           int write_timeout_ms = DEFAULT_WRITE_TIMEOUT_MS);

    /**
     * Send a mail to host:port.
     * Fails with ErrorCode::ConnectionError; never retries.
     */
    Result<void> send_mail(const Mail& mail, const QString& host, quint16 port) const;
    Result<void> send_mail(const Mail& mail, const QHostAddress& address, quint16 port) const;

    /**
     * Ask the instance listening on localhost:local_port to shut down.
     * Failures are ignored: there may be no instance running.
     */
    void send_shutdown(quint16 local_port) const;

    [[nodiscard]] int connectTimeoutMs() const { return connect_timeout_ms_; }

private:
    int connect_timeout_ms_;
    int write_timeout_ms_;

    Result<void> deliver(const QByteArray& payload, const QString& host, quint16 port) const;
};

} // namespace lanmail::network
