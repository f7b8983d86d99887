#pragma once

#include <QFuture>
#include <QHash>
#include <QJsonValue>
#include <QList>
#include <QObject>
#include <QPromise>
#include <QSize>
#include <QTimer>
#include <functional>
#include <memory>

#include <plink/Client/ClientConfig.hpp>
#include <plink/Client/ConnectionStatus.hpp>
#include <plink/Client/LinkError.hpp>
#include <plink/Client/ReconnectBackoff.hpp>
#include <plink/Message/Message.hpp>
#include <plink/Transport/ITransport.hpp>

namespace plink {

/// Message link between the desktop UI and the backend.
///
/// Owns one transport at a time and drives it through
/// Disconnected -> Connecting -> Connected -> Reconnecting -> Connecting ...
/// Requests are correlated to responses by id, queued while the link is
/// down, and replayed once it comes back. Inbound messages that answer no
/// pending request are broadcast to the handlers registered for their type.
///
/// Not thread-safe: use from the thread that owns the object.
class LinkClient : public QObject {
    Q_OBJECT
    Q_PROPERTY(plink::ConnectionStatus status READ status NOTIFY statusChanged)
    Q_PROPERTY(int reconnectAttempt READ reconnectAttempt NOTIFY statusChanged)

public:
    using Handler = std::function<void(const Message& message)>;
    using StatusListener = std::function<void(ConnectionStatus status, int reconnectAttempt)>;
    using TransportFactory = std::function<ITransport*(QObject* parent)>;

    /// Uses a WebSocketTransport for every connection attempt.
    explicit LinkClient(const ClientConfig& config = {}, QObject* parent = nullptr);
    LinkClient(const ClientConfig& config, TransportFactory factory,
               QObject* parent = nullptr);
    ~LinkClient() override;

    /// Open the link. No-op while connecting or connected.
    void connect();

    /// Close the link and stop reconnecting. Every pending request and
    /// queued operation fails with DisconnectedError.
    void disconnect();

    /// Send a message. Fire-and-forget types resolve with nullopt once
    /// written; other types resolve with the correlated response or fail
    /// with TimeoutError. While not connected the call is queued.
    QFuture<SendResult> send(const QString& type, const QJsonValue& payload = {});

    /// Register a broadcast handler. Returns an id for off().
    int on(const QString& type, Handler handler);
    void off(const QString& type, int handlerId);
    bool hasHandlers(const QString& type) const;

    /// Returns a function that removes the listener again.
    std::function<void()> onStatusChange(StatusListener listener);

    /// Window size reported in the next handshake.
    void setWindowSize(const QSize& size);

    ConnectionStatus status() const;
    int reconnectAttempt() const;
    int pendingRequestCount() const;
    int queuedOperationCount() const;
    /// Delay of the pending reconnect in ms, or -1 if none is scheduled.
    int scheduledReconnectDelay() const;
    const ClientConfig& config() const;

signals:
    void statusChanged(plink::ConnectionStatus status, int reconnectAttempt);
    void broadcastReceived(const plink::Message& message);
    void messageSent(const plink::Message& message);
    void transportError(const QString& message);

private:
    using PromisePtr = std::shared_ptr<QPromise<SendResult>>;

    struct PendingRequest {
        QString type;
        PromisePtr promise;
        QTimer* timer = nullptr;
    };

    struct QueuedOperation {
        QString type;
        QJsonValue payload;
        PromisePtr promise;
    };

    struct HandlerEntry {
        int id;
        Handler handler;
    };

    struct ListenerEntry {
        int id;
        StatusListener listener;
    };

    // Transport events
    void onTransportOpened(ITransport* transport);
    void onTransportText(ITransport* transport, const QString& text);
    void onTransportClosed(ITransport* transport);
    void onTransportError(ITransport* transport, const QString& message);

    void dispatch(const QString& type, const QJsonValue& payload, const PromisePtr& promise);
    void dispatchBroadcast(const Message& message);
    void onRequestTimeout(const QString& id);
    void sendHandshake();
    void flushQueue();
    void writeMessage(const Message& message);

    void scheduleReconnect();
    void releaseTransport();
    void failAll(const LinkError& error);
    void setStatus(ConnectionStatus status);
    void removeStatusListener(int listenerId);
    bool isFireAndForget(const QString& type) const;
    QString nextCorrelationId() const;

    ClientConfig config_;
    ReconnectBackoff backoff_;
    TransportFactory transportFactory_;
    ITransport* transport_ = nullptr;

    ConnectionStatus status_ = ConnectionStatus::Disconnected;
    int reconnectAttempt_ = 0;
    bool flushing_ = false;
    QTimer reconnectTimer_;

    QHash<QString, PendingRequest> pending_;
    QList<QueuedOperation> queue_;
    QHash<QString, QList<HandlerEntry>> handlers_;
    QList<ListenerEntry> statusListeners_;
    int nextHandlerId_ = 1;
    int nextListenerId_ = 1;
};

} // namespace plink
