#pragma once

#include <QList>

namespace plink {

/// Capped lookup into a fixed delay table. Attempt n (1-based) uses
/// table[min(n-1, size-1)]; no delay exceeds MAX_RECONNECT_DELAY_MS.
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(const QList<int>& delays);

    int delayFor(int attempt) const;
    const QList<int>& delays() const { return delays_; }

private:
    QList<int> delays_;
};

} // namespace plink
