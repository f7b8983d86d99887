#pragma once

#include <QByteArray>
#include <QException>
#include <QString>

namespace plink {

/// Base of every error delivered through a send() future.
class LinkError : public QException {
public:
    explicit LinkError(const QString& message);

    QString message() const { return message_; }
    const char* what() const noexcept override;

    void raise() const override { throw *this; }
    LinkError* clone() const override { return new LinkError(*this); }

private:
    QString message_;
    QByteArray what_;
};

/// The request was pending or queued when disconnect() was called, or the
/// transport was not open when the request reached it.
class DisconnectedError : public LinkError {
public:
    DisconnectedError();
    explicit DisconnectedError(const QString& message);

    void raise() const override { throw *this; }
    DisconnectedError* clone() const override { return new DisconnectedError(*this); }
};

/// No correlated response arrived within the timeout window.
class TimeoutError : public LinkError {
public:
    TimeoutError(const QString& messageType, int timeoutMs);

    QString messageType() const { return messageType_; }
    int timeoutMs() const { return timeoutMs_; }

    void raise() const override { throw *this; }
    TimeoutError* clone() const override { return new TimeoutError(*this); }

private:
    QString messageType_;
    int timeoutMs_;
};

} // namespace plink
