#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>
#include <QString>
#include <optional>

namespace plink {

/// Envelope shared by every message on the wire, in both directions:
///   { "type": string, "id"?: string, "payload": any, "timestamp": ms }
struct Message {
    QString type;
    QString id;              // empty unless correlated
    QJsonValue payload;
    qint64 timestamp = 0;    // ms since epoch

    bool hasId() const { return !id.isEmpty(); }

    QJsonObject toJsonObject() const;
    QByteArray toJson() const;

    /// Decode one inbound frame. Returns nullopt for invalid JSON, a
    /// non-object document, or a missing/non-string "type"; the reason is
    /// written to errorString when given.
    static std::optional<Message> fromJson(const QByteArray& data,
                                           QString* errorString = nullptr);

    /// Build an outbound message stamped with the current time.
    static Message make(const QString& type, const QJsonValue& payload,
                        const QString& id = {});
};

/// Resolved value of LinkClient::send(): the correlated response, or
/// nullopt for fire-and-forget types.
using SendResult = std::optional<Message>;

} // namespace plink

Q_DECLARE_METATYPE(plink::Message)
