#include "remotebackend.h"

namespace Stash {

QString RemoteError::describe() const
{
    QStringList parts;
    if (status > 0) {
        parts << QString("HTTP %1").arg(status);
    }
    if (!code.isEmpty()) {
        parts << QString("code %1").arg(code);
    }
    if (timedOut) {
        parts << "timed out";
    }
    if (!message.isEmpty()) {
        parts << message;
    }
    return parts.isEmpty() ? QString("Unknown remote error") : parts.join(": ");
}

RemoteErrorClass classifyRemoteError(const RemoteError &error)
{
    if (error.timedOut || error.networkFailure) {
        return RemoteErrorClass::Transient;
    }

    if (error.status == 408 || error.status == 429 || error.status >= 500) {
        return RemoteErrorClass::Transient;
    }

    // SQLSTATE connection exceptions and statement timeout
    if (error.code.startsWith("08") || error.code == "57014") {
        return RemoteErrorClass::Transient;
    }

    // Message text only decides when there was no response to classify
    if (error.status == 0 && error.code.isEmpty()) {
        const QString message = error.message.toLower();
        static const QStringList transientMarkers = {
            "network", "timeout", "timed out", "failed to fetch", "connection"
        };
        for (const QString &marker : transientMarkers) {
            if (message.contains(marker)) {
                return RemoteErrorClass::Transient;
            }
        }
    }

    return RemoteErrorClass::DataLevel;
}

} // namespace Stash
