#include <plink/Transport/ReplayTransport.hpp>

namespace plink {

ReplayTransport::ReplayTransport(QObject* parent)
    : ITransport(parent)
{
}

ReplayTransport::~ReplayTransport() = default;

void ReplayTransport::open(const QUrl& url)
{
    url_ = url;
    openRequested_ = true;
}

void ReplayTransport::close()
{
    closeRequested_ = true;
    if (openRequested_)
        simulateClose();
}

void ReplayTransport::sendText(const QString& text)
{
    sent_.append(text);
}

bool ReplayTransport::isOpen() const
{
    return open_;
}

void ReplayTransport::simulateOpen()
{
    open_ = true;
    emit opened();
}

void ReplayTransport::simulateClose()
{
    open_ = false;
    if (closedEmitted_)
        return;
    closedEmitted_ = true;
    emit closed();
}

void ReplayTransport::simulateError(const QString& message)
{
    emit error(message);
}

void ReplayTransport::feedText(const QString& text)
{
    emit textReceived(text);
}

QUrl ReplayTransport::url() const
{
    return url_;
}

bool ReplayTransport::openRequested() const
{
    return openRequested_;
}

bool ReplayTransport::closeRequested() const
{
    return closeRequested_;
}

QList<QString> ReplayTransport::sentMessages() const
{
    return sent_;
}

void ReplayTransport::clearSent()
{
    sent_.clear();
}

} // namespace plink
