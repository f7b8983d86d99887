#pragma once

#include <QObject>
#include <QString>

namespace plink {
Q_NAMESPACE

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};
Q_ENUM_NS(ConnectionStatus)

inline QString toString(ConnectionStatus status)
{
    switch (status) {
    case ConnectionStatus::Disconnected: return QStringLiteral("disconnected");
    case ConnectionStatus::Connecting:   return QStringLiteral("connecting");
    case ConnectionStatus::Connected:    return QStringLiteral("connected");
    case ConnectionStatus::Reconnecting: return QStringLiteral("reconnecting");
    }
    return QStringLiteral("unknown");
}

} // namespace plink
