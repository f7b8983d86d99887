#include <plink/Message/Message.hpp>
#include <QDateTime>
#include <QJsonDocument>
#include <QJsonParseError>

namespace plink {

QJsonObject Message::toJsonObject() const
{
    QJsonObject obj;
    obj["type"] = type;
    if (hasId())
        obj["id"] = id;
    obj["payload"] = payload.isUndefined() ? QJsonValue(QJsonValue::Null) : payload;
    obj["timestamp"] = static_cast<double>(timestamp);
    return obj;
}

QByteArray Message::toJson() const
{
    return QJsonDocument(toJsonObject()).toJson(QJsonDocument::Compact);
}

std::optional<Message> Message::fromJson(const QByteArray& data, QString* errorString)
{
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        if (errorString)
            *errorString = err.errorString();
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (errorString)
            *errorString = QStringLiteral("message is not a JSON object");
        return std::nullopt;
    }

    QJsonObject obj = doc.object();
    QJsonValue type = obj.value("type");
    if (!type.isString() || type.toString().isEmpty()) {
        if (errorString)
            *errorString = QStringLiteral("missing message type");
        return std::nullopt;
    }

    Message msg;
    msg.type = type.toString();
    // Non-string ids cannot match a correlation; treat them as absent.
    msg.id = obj.value("id").toString();
    msg.payload = obj.value("payload");
    msg.timestamp = static_cast<qint64>(obj.value("timestamp").toDouble(0));
    return msg;
}

Message Message::make(const QString& type, const QJsonValue& payload, const QString& id)
{
    Message msg;
    msg.type = type;
    msg.id = id;
    msg.payload = payload;
    msg.timestamp = QDateTime::currentMSecsSinceEpoch();
    return msg;
}

} // namespace plink
