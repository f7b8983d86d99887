#include <plink/Client/LinkClient.hpp>
#include <plink/Transport/WebSocketTransport.hpp>
#include <QDebug>
#include <QJsonObject>
#include <QPointer>
#include <QSysInfo>
#include <QUuid>
#include <exception>
#include <utility>

namespace plink {

namespace {

void resolvePromise(QPromise<SendResult>& promise, const SendResult& result)
{
    promise.addResult(result);
    promise.finish();
}

void rejectPromise(QPromise<SendResult>& promise, const LinkError& error)
{
    promise.setException(error);
    promise.finish();
}

QString hostPlatform()
{
    return QSysInfo::kernelType() + QLatin1Char('-') + QSysInfo::currentCpuArchitecture();
}

} // namespace

LinkClient::LinkClient(const ClientConfig& config, QObject* parent)
    : LinkClient(config, TransportFactory(), parent)
{
}

LinkClient::LinkClient(const ClientConfig& config, TransportFactory factory, QObject* parent)
    : QObject(parent)
    , config_(config)
    , backoff_(config.reconnectDelays)
    , transportFactory_(std::move(factory))
{
    if (!transportFactory_) {
        transportFactory_ = [](QObject* owner) -> ITransport* {
            return new WebSocketTransport(owner);
        };
    }

    reconnectTimer_.setSingleShot(true);
    QObject::connect(&reconnectTimer_, &QTimer::timeout, this, [this]() {
        qInfo() << "[LinkClient] Reconnect attempt" << reconnectAttempt_;
        connect();
    });
}

LinkClient::~LinkClient()
{
    reconnectTimer_.stop();
    releaseTransport();
    // No status notification here: listeners may already be gone.
    failAll(DisconnectedError());
}

// --- Connection lifecycle ---

void LinkClient::connect()
{
    if (transport_ && (status_ == ConnectionStatus::Connecting
                       || status_ == ConnectionStatus::Connected))
        return;

    reconnectTimer_.stop();
    setStatus(ConnectionStatus::Connecting);
    if (status_ != ConnectionStatus::Connecting)
        return;  // a listener took the link elsewhere

    releaseTransport();
    ITransport* transport = transportFactory_(this);
    transport_ = transport;

    QObject::connect(transport, &ITransport::opened, this, [this, transport]() {
        onTransportOpened(transport);
    });
    QObject::connect(transport, &ITransport::textReceived, this,
                     [this, transport](const QString& text) {
        onTransportText(transport, text);
    });
    QObject::connect(transport, &ITransport::closed, this, [this, transport]() {
        onTransportClosed(transport);
    });
    QObject::connect(transport, &ITransport::error, this,
                     [this, transport](const QString& message) {
        onTransportError(transport, message);
    });

    qInfo() << "[LinkClient] Connecting to" << config_.url.toString();
    transport->open(config_.url);
}

void LinkClient::disconnect()
{
    reconnectTimer_.stop();
    reconnectAttempt_ = 0;

    releaseTransport();
    // Listeners see Disconnected before any future settles, so a send()
    // issued from a continuation is queued for the next connect().
    setStatus(ConnectionStatus::Disconnected);
    failAll(DisconnectedError());
}

void LinkClient::onTransportOpened(ITransport* transport)
{
    if (transport != transport_)
        return;

    qInfo() << "[LinkClient] Connected to" << config_.url.toString();
    reconnectAttempt_ = 0;

    // Sends issued by status listeners queue behind the handshake and the
    // operations already waiting.
    flushing_ = true;
    setStatus(ConnectionStatus::Connected);
    if (status_ == ConnectionStatus::Connected) {
        sendHandshake();
        flushQueue();
    }
    flushing_ = false;
}

void LinkClient::onTransportClosed(ITransport* transport)
{
    if (transport != transport_)
        return;

    releaseTransport();
    if (status_ == ConnectionStatus::Disconnected)
        return;

    scheduleReconnect();
}

void LinkClient::onTransportError(ITransport* transport, const QString& message)
{
    if (transport != transport_)
        return;

    // closed() follows and drives the state change.
    qWarning() << "[LinkClient] Connection error:" << message;
    emit transportError(message);
}

void LinkClient::scheduleReconnect()
{
    ++reconnectAttempt_;
    int delay = backoff_.delayFor(reconnectAttempt_);
    qInfo() << "[LinkClient] Connection lost, retrying in" << delay
            << "ms (attempt" << reconnectAttempt_ << ")";

    // Started first so listeners can read scheduledReconnectDelay().
    reconnectTimer_.start(delay);
    setStatus(ConnectionStatus::Reconnecting);
    if (status_ != ConnectionStatus::Reconnecting)
        reconnectTimer_.stop();
}

void LinkClient::releaseTransport()
{
    if (!transport_)
        return;

    ITransport* transport = std::exchange(transport_, nullptr);
    QObject::disconnect(transport, nullptr, this, nullptr);
    transport->close();
    transport->deleteLater();
}

// --- Sending ---

QFuture<SendResult> LinkClient::send(const QString& type, const QJsonValue& payload)
{
    auto promise = std::make_shared<QPromise<SendResult>>();
    promise->start();
    QFuture<SendResult> future = promise->future();

    if (flushing_ || status_ != ConnectionStatus::Connected || !transport_
        || !transport_->isOpen()) {
        queue_.append({type, payload, promise});
        qDebug() << "[LinkClient] Queued" << type << "(" << queue_.size() << "waiting )";
        return future;
    }

    dispatch(type, payload, promise);
    return future;
}

void LinkClient::dispatch(const QString& type, const QJsonValue& payload,
                          const PromisePtr& promise)
{
    if (!transport_ || !transport_->isOpen()) {
        rejectPromise(*promise, DisconnectedError(QStringLiteral("WebSocket is not open")));
        return;
    }

    if (isFireAndForget(type)) {
        writeMessage(Message::make(type, payload));
        resolvePromise(*promise, std::nullopt);
        return;
    }

    QString id = nextCorrelationId();
    auto* timer = new QTimer(this);
    timer->setSingleShot(true);
    QObject::connect(timer, &QTimer::timeout, this, [this, id]() { onRequestTimeout(id); });

    pending_.insert(id, PendingRequest{type, promise, timer});
    timer->start(config_.correlationTimeout);

    writeMessage(Message::make(type, payload, id));
}

void LinkClient::writeMessage(const Message& message)
{
    transport_->sendText(QString::fromUtf8(message.toJson()));
    emit messageSent(message);
}

void LinkClient::onRequestTimeout(const QString& id)
{
    auto it = pending_.find(id);
    if (it == pending_.end())
        return;

    PendingRequest request = it.value();
    pending_.erase(it);
    request.timer->deleteLater();

    qWarning() << "[LinkClient] Request timed out after" << config_.correlationTimeout
               << "ms:" << request.type << "id" << id;
    rejectPromise(*request.promise, TimeoutError(request.type, config_.correlationTimeout));
}

void LinkClient::sendHandshake()
{
    const HandshakeConfig& handshake = config_.handshake;

    QJsonObject payload;
    payload["version"] = handshake.version;
    payload["platform"] = handshake.platform.isEmpty() ? hostPlatform() : handshake.platform;
    if (handshake.windowSize.isValid()) {
        QJsonObject windowSize;
        windowSize["width"] = handshake.windowSize.width();
        windowSize["height"] = handshake.windowSize.height();
        payload["windowSize"] = windowSize;
    }

    qDebug() << "[LinkClient] Sending" << handshake.type;
    writeMessage(Message::make(handshake.type, payload));
}

void LinkClient::flushQueue()
{
    if (!queue_.isEmpty())
        qInfo() << "[LinkClient] Flushing" << queue_.size() << "queued operation(s)";

    // Operations queued while flushing go out in the same pass.
    while (!queue_.isEmpty()) {
        if (status_ != ConnectionStatus::Connected)
            return;
        QueuedOperation op = queue_.takeFirst();
        dispatch(op.type, op.payload, op.promise);
    }
}

void LinkClient::failAll(const LinkError& error)
{
    QHash<QString, PendingRequest> pending = std::exchange(pending_, {});
    QList<QueuedOperation> queue = std::exchange(queue_, {});

    for (const PendingRequest& request : pending) {
        request.timer->stop();
        request.timer->deleteLater();
    }

    if (!pending.isEmpty() || !queue.isEmpty()) {
        qInfo() << "[LinkClient] Failing" << pending.size() << "pending request(s) and"
                << queue.size() << "queued operation(s):" << error.message();
    }

    for (const PendingRequest& request : pending)
        rejectPromise(*request.promise, error);
    for (const QueuedOperation& op : queue)
        rejectPromise(*op.promise, error);
}

// --- Inbound ---

void LinkClient::onTransportText(ITransport* transport, const QString& text)
{
    if (transport != transport_)
        return;

    QString parseError;
    std::optional<Message> message = Message::fromJson(text.toUtf8(), &parseError);
    if (!message) {
        qWarning() << "[LinkClient] Failed to parse message:" << parseError
                   << "data:" << text.left(200);
        return;
    }

    if (message->hasId()) {
        auto it = pending_.find(message->id);
        if (it != pending_.end()) {
            PendingRequest request = it.value();
            pending_.erase(it);
            request.timer->stop();
            request.timer->deleteLater();
            resolvePromise(*request.promise, *message);
            return;
        }
    }

    dispatchBroadcast(*message);
}

void LinkClient::dispatchBroadcast(const Message& message)
{
    emit broadcastReceived(message);

    auto it = handlers_.constFind(message.type);
    if (it == handlers_.constEnd())
        return;

    // Handlers may call on()/off() while we iterate.
    const QList<HandlerEntry> snapshot = it.value();
    for (const HandlerEntry& entry : snapshot) {
        try {
            entry.handler(message);
        } catch (const std::exception& e) {
            qWarning() << "[LinkClient] Handler error for" << message.type << ":" << e.what();
        } catch (...) {
            qWarning() << "[LinkClient] Handler error for" << message.type
                       << ": unknown exception";
        }
    }
}

// --- Handlers and listeners ---

int LinkClient::on(const QString& type, Handler handler)
{
    int id = nextHandlerId_++;
    handlers_[type].append({id, std::move(handler)});
    return id;
}

void LinkClient::off(const QString& type, int handlerId)
{
    auto it = handlers_.find(type);
    if (it == handlers_.end())
        return;

    QList<HandlerEntry>& entries = it.value();
    for (int i = 0; i < entries.size(); ++i) {
        if (entries[i].id == handlerId) {
            entries.removeAt(i);
            break;
        }
    }
    if (entries.isEmpty())
        handlers_.erase(it);
}

bool LinkClient::hasHandlers(const QString& type) const
{
    return handlers_.contains(type);
}

std::function<void()> LinkClient::onStatusChange(StatusListener listener)
{
    int id = nextListenerId_++;
    statusListeners_.append({id, std::move(listener)});

    QPointer<LinkClient> self(this);
    return [self, id]() {
        if (self)
            self->removeStatusListener(id);
    };
}

void LinkClient::removeStatusListener(int listenerId)
{
    for (int i = 0; i < statusListeners_.size(); ++i) {
        if (statusListeners_[i].id == listenerId) {
            statusListeners_.removeAt(i);
            return;
        }
    }
}

void LinkClient::setStatus(ConnectionStatus status)
{
    if (status_ == status)
        return;

    status_ = status;
    const int attempt = reconnectAttempt_;
    qDebug() << "[LinkClient] Status:" << toString(status) << "attempt:" << attempt;

    const QList<ListenerEntry> snapshot = statusListeners_;
    for (const ListenerEntry& entry : snapshot) {
        try {
            entry.listener(status, attempt);
        } catch (const std::exception& e) {
            qWarning() << "[LinkClient] Status listener error:" << e.what();
        } catch (...) {
            qWarning() << "[LinkClient] Status listener error: unknown exception";
        }
    }

    // A listener may already have moved the link on.
    if (status_ == status)
        emit statusChanged(status, attempt);
}

// --- Accessors ---

void LinkClient::setWindowSize(const QSize& size)
{
    config_.handshake.windowSize = size;
}

ConnectionStatus LinkClient::status() const { return status_; }
int LinkClient::reconnectAttempt() const { return reconnectAttempt_; }
int LinkClient::pendingRequestCount() const { return pending_.size(); }
int LinkClient::queuedOperationCount() const { return queue_.size(); }
const ClientConfig& LinkClient::config() const { return config_; }

int LinkClient::scheduledReconnectDelay() const
{
    return reconnectTimer_.isActive() ? reconnectTimer_.interval() : -1;
}

bool LinkClient::isFireAndForget(const QString& type) const
{
    return config_.fireAndForgetTypes.contains(type);
}

QString LinkClient::nextCorrelationId() const
{
    QString id;
    do {
        id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    } while (pending_.contains(id));
    return id;
}

} // namespace plink
