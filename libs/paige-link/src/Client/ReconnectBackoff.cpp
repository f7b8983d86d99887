#include <plink/Client/ReconnectBackoff.hpp>
#include <plink/Version.hpp>
#include <QtGlobal>

namespace plink {

ReconnectBackoff::ReconnectBackoff(const QList<int>& delays)
    : delays_(delays)
{
}

int ReconnectBackoff::delayFor(int attempt) const
{
    if (delays_.isEmpty())
        return MAX_RECONNECT_DELAY_MS;

    int index = qBound(0, attempt - 1, static_cast<int>(delays_.size()) - 1);
    return qBound(0, delays_.at(index), MAX_RECONNECT_DELAY_MS);
}

} // namespace plink
