#pragma once

#include <QMetaType>
#include <QString>
#include <QtGlobal>

namespace lanmail {

/**
 * Mail - one payload sent from one instance to exactly one peer.
 *
 * `node_string` is an opaque blob produced by the host application (an
 * encoded node selection); it is transported verbatim and never inspected.
 */
struct Mail {
    QString sender_name;
    QString message;
    QString node_string;
    qint64 timestamp = 0;  // unix seconds, set by the sender

    bool operator==(const Mail& other) const = default;
};

} // namespace lanmail

Q_DECLARE_METATYPE(lanmail::Mail)
