#include <plink/Transport/WebSocketTransport.hpp>
#include <QDebug>
#include <QMetaObject>

namespace plink {

WebSocketTransport::WebSocketTransport(QObject* parent)
    : ITransport(parent)
    , socket_(new QWebSocket(QString(), QWebSocketProtocol::VersionLatest, this))
{
    connect(socket_, &QWebSocket::connected, this, &ITransport::opened);
    connect(socket_, &QWebSocket::textMessageReceived, this, &ITransport::textReceived);
    connect(socket_, &QWebSocket::disconnected, this, &WebSocketTransport::emitClosedOnce);
    connect(socket_, &QWebSocket::errorOccurred, this, &WebSocketTransport::onSocketError);
}

WebSocketTransport::~WebSocketTransport()
{
    disconnect(socket_, nullptr, this, nullptr);
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->abort();
}

void WebSocketTransport::open(const QUrl& url)
{
    if (opened_) {
        qWarning() << "[WebSocketTransport] open() called twice, ignoring";
        return;
    }
    opened_ = true;
    socket_->open(url);
}

void WebSocketTransport::close()
{
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->close();
}

void WebSocketTransport::sendText(const QString& text)
{
    if (!isOpen()) {
        qWarning() << "[WebSocketTransport] send DROPPED:" << text.size()
                   << "chars (socket state:" << static_cast<int>(socket_->state()) << ")";
        return;
    }
    socket_->sendTextMessage(text);
}

bool WebSocketTransport::isOpen() const
{
    return socket_->state() == QAbstractSocket::ConnectedState;
}

void WebSocketTransport::onSocketError(QAbstractSocket::SocketError error)
{
    Q_UNUSED(error)
    emit this->error(socket_->errorString());

    // A refused or unresolved connection may never report disconnected();
    // make sure the close still reaches listeners, once.
    if (socket_->state() == QAbstractSocket::UnconnectedState) {
        QMetaObject::invokeMethod(this, &WebSocketTransport::emitClosedOnce,
                                  Qt::QueuedConnection);
    }
}

void WebSocketTransport::emitClosedOnce()
{
    if (closedEmitted_ || !opened_)
        return;
    closedEmitted_ = true;
    emit closed();
}

} // namespace plink
