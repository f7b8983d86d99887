#include "core/LinkMonitor.hpp"
#include <boost/log/trivial.hpp>

namespace paige {

LinkMonitor::LinkMonitor(QObject* parent)
    : QObject(parent)
{
}

LinkMonitor::~LinkMonitor()
{
    detach();
    closeTrace();
}

void LinkMonitor::attach(plink::LinkClient* client)
{
    detach();
    client_ = client;
    if (!client_) return;

    connect(client_, &plink::LinkClient::statusChanged, this, &LinkMonitor::onStatusChanged);
    connect(client_, &plink::LinkClient::broadcastReceived, this, &LinkMonitor::onInbound);
    connect(client_, &plink::LinkClient::messageSent, this, &LinkMonitor::onOutbound);
    connect(client_, &plink::LinkClient::transportError, this, &LinkMonitor::onTransportError);
    // Drop the pointer if the client goes away first.
    connect(client_, &QObject::destroyed, this, [this]() { client_ = nullptr; });
}

void LinkMonitor::detach()
{
    if (client_) {
        disconnect(client_, nullptr, this, nullptr);
        client_ = nullptr;
    }
}

bool LinkMonitor::isAttached() const
{
    return client_ != nullptr;
}

bool LinkMonitor::openTrace(const std::string& path)
{
    if (trace_.is_open()) trace_.close();
    trace_.open(path, std::ios::trunc);
    if (!trace_.is_open()) {
        BOOST_LOG_TRIVIAL(error) << "[LinkMonitor] Cannot open trace file " << path;
        return false;
    }
    traceStart_ = std::chrono::steady_clock::now();
    trace_ << "ELAPSED_MS\tDIR\tTYPE\tID\tMESSAGE\n";
    trace_.flush();
    return true;
}

void LinkMonitor::closeTrace()
{
    if (trace_.is_open())
        trace_.close();
}

bool LinkMonitor::isTraceOpen() const
{
    return trace_.is_open();
}

int LinkMonitor::inboundCount() const { return inbound_; }
int LinkMonitor::inboundCount(const QString& type) const { return inboundByType_.value(type); }
int LinkMonitor::outboundCount() const { return outbound_; }
int LinkMonitor::statusChangeCount() const { return statusChanges_; }
int LinkMonitor::errorCount() const { return errors_; }
int LinkMonitor::lastReconnectDelay() const { return lastReconnectDelay_; }

void LinkMonitor::onStatusChanged(plink::ConnectionStatus status, int attempt)
{
    ++statusChanges_;
    if (status == plink::ConnectionStatus::Reconnecting) {
        lastReconnectDelay_ = client_ ? client_->scheduledReconnectDelay() : -1;
        BOOST_LOG_TRIVIAL(info) << "[LinkMonitor] Link " << plink::toString(status).toStdString()
                                << " (attempt " << attempt << ", next try in "
                                << lastReconnectDelay_ << "ms)";
    } else {
        BOOST_LOG_TRIVIAL(info) << "[LinkMonitor] Link " << plink::toString(status).toStdString();
    }
}

void LinkMonitor::onInbound(const plink::Message& message)
{
    ++inbound_;
    ++inboundByType_[message.type];
    BOOST_LOG_TRIVIAL(debug) << "[LinkMonitor] <- " << message.type.toStdString()
                             << (message.hasId() ? " id=" + message.id.toStdString() : "");
    trace("in", message);
}

void LinkMonitor::onOutbound(const plink::Message& message)
{
    ++outbound_;
    BOOST_LOG_TRIVIAL(debug) << "[LinkMonitor] -> " << message.type.toStdString()
                             << (message.hasId() ? " id=" + message.id.toStdString() : "");
    trace("out", message);
}

void LinkMonitor::onTransportError(const QString& message)
{
    ++errors_;
    BOOST_LOG_TRIVIAL(warning) << "[LinkMonitor] Transport error: " << message.toStdString();
}

void LinkMonitor::trace(const char* direction, const plink::Message& message)
{
    if (!trace_.is_open()) return;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - traceStart_).count();
    trace_ << elapsed << '\t' << direction << '\t' << message.type.toStdString() << '\t'
           << (message.hasId() ? message.id.toStdString() : "-") << '\t'
           << message.toJson().toStdString() << '\n';
    trace_.flush();
}

} // namespace paige
