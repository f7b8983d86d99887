#include <plink/Client/LinkError.hpp>

namespace plink {

LinkError::LinkError(const QString& message)
    : message_(message)
    , what_(message.toUtf8())
{
}

const char* LinkError::what() const noexcept
{
    return what_.constData();
}

DisconnectedError::DisconnectedError()
    : LinkError(QStringLiteral("WebSocket disconnected"))
{
}

DisconnectedError::DisconnectedError(const QString& message)
    : LinkError(message)
{
}

TimeoutError::TimeoutError(const QString& messageType, int timeoutMs)
    : LinkError(QStringLiteral("Request timed out after %1ms: %2").arg(timeoutMs).arg(messageType))
    , messageType_(messageType)
    , timeoutMs_(timeoutMs)
{
}

} // namespace plink
