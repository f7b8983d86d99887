#pragma once

#include <plink/Message/MessageTypes.hpp>
#include <plink/Version.hpp>
#include <QList>
#include <QSet>
#include <QSize>
#include <QString>
#include <QUrl>

namespace plink {

struct HandshakeConfig {
    QString type = ClientMessageType::CONNECTION_HELLO;
    QString version = CLIENT_VERSION;
    QString platform;         // empty: detected from the host at send time
    QSize windowSize;         // invalid: windowSize omitted from the payload
};

struct ClientConfig {
    QUrl url = QUrl(QString::fromLatin1(DEFAULT_URL));

    // Timeouts (ms)
    int correlationTimeout = CORRELATION_TIMEOUT_MS;
    QList<int> reconnectDelays = {1000, 2000, 4000, 8000, 16000, 30000};

    QSet<QString> fireAndForgetTypes = defaultFireAndForgetTypes();

    HandshakeConfig handshake;
};

} // namespace plink
