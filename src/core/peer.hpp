#pragma once

#include "core/types.hpp"

#include <QHostAddress>
#include <QString>

namespace lanmail {

/**
 * Peer - another running instance, keyed by its announced name.
 */
struct Peer {
    QString name;
    QHostAddress address;
    bool favorite = false;
    Timestamp last_seen;
};

} // namespace lanmail
