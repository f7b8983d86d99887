#pragma once

#include <QObject>
#include <QString>
#include <QUrl>

namespace plink {

/// One text-message connection. A transport is opened at most once; the
/// client creates a fresh transport for every connection attempt.
///
/// Every transport that was opened emits closed() exactly once, whether the
/// attempt failed, the peer went away, or close() was called. error() is
/// informational and is always followed by closed().
class ITransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~ITransport() override = default;

    virtual void open(const QUrl& url) = 0;
    virtual void close() = 0;
    virtual void sendText(const QString& text) = 0;
    virtual bool isOpen() const = 0;

signals:
    void opened();
    void textReceived(const QString& text);
    void closed();
    void error(const QString& message);
};

} // namespace plink
