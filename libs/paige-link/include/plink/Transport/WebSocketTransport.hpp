#pragma once

#include <plink/Transport/ITransport.hpp>
#include <QAbstractSocket>
#include <QWebSocket>

namespace plink {

class WebSocketTransport : public ITransport {
    Q_OBJECT
public:
    explicit WebSocketTransport(QObject* parent = nullptr);
    ~WebSocketTransport() override;

    void open(const QUrl& url) override;
    void close() override;
    void sendText(const QString& text) override;
    bool isOpen() const override;

private:
    void onSocketError(QAbstractSocket::SocketError error);
    void emitClosedOnce();

    QWebSocket* socket_;
    bool opened_ = false;
    bool closedEmitted_ = false;
};

} // namespace plink
