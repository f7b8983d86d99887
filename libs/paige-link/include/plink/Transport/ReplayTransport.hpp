#pragma once

#include <plink/Transport/ITransport.hpp>
#include <QList>

namespace plink {

/// In-memory transport driven by the test. Nothing happens on open() until
/// simulateOpen() is called.
class ReplayTransport : public ITransport {
    Q_OBJECT
public:
    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    // ITransport interface
    void open(const QUrl& url) override;
    void close() override;
    void sendText(const QString& text) override;
    bool isOpen() const override;

    // Test API
    void simulateOpen();
    void simulateClose();
    void simulateError(const QString& message);
    void feedText(const QString& text);
    QUrl url() const;
    bool openRequested() const;
    bool closeRequested() const;
    QList<QString> sentMessages() const;
    void clearSent();

private:
    QUrl url_;
    bool openRequested_ = false;
    bool closeRequested_ = false;
    bool open_ = false;
    bool closedEmitted_ = false;
    QList<QString> sent_;
};

} // namespace plink
