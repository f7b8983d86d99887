#pragma once

#include <QHash>
#include <QObject>
#include <QString>
#include <chrono>
#include <fstream>
#include <string>
#include <plink/Client/LinkClient.hpp>

namespace paige {

/// Writes link status transitions and message traffic to the application
/// log. Optionally mirrors every message to a TSV trace file.
class LinkMonitor : public QObject {
    Q_OBJECT

public:
    explicit LinkMonitor(QObject* parent = nullptr);
    ~LinkMonitor() override;

    void attach(plink::LinkClient* client);
    void detach();
    bool isAttached() const;

    /// Trace columns: ELAPSED_MS, DIR (in/out), TYPE, ID, MESSAGE
    bool openTrace(const std::string& path);
    void closeTrace();
    bool isTraceOpen() const;

    int inboundCount() const;
    int inboundCount(const QString& type) const;
    int outboundCount() const;
    int statusChangeCount() const;
    int errorCount() const;
    /// Retry delay announced with the latest Reconnecting transition, or -1.
    int lastReconnectDelay() const;

private:
    void onStatusChanged(plink::ConnectionStatus status, int attempt);
    void onInbound(const plink::Message& message);
    void onOutbound(const plink::Message& message);
    void onTransportError(const QString& message);
    void trace(const char* direction, const plink::Message& message);

    plink::LinkClient* client_ = nullptr;
    std::ofstream trace_;
    std::chrono::steady_clock::time_point traceStart_;

    QHash<QString, int> inboundByType_;
    int inbound_ = 0;
    int outbound_ = 0;
    int statusChanges_ = 0;
    int errors_ = 0;
    int lastReconnectDelay_ = -1;
};

} // namespace paige
