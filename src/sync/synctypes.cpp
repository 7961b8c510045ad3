#include "synctypes.h"

#include <QCoreApplication>

namespace Stash {

QString resolutionChoiceToString(ResolutionChoice choice)
{
    switch (choice) {
        case ResolutionChoice::Local:  return QStringLiteral("local");
        case ResolutionChoice::Server: return QStringLiteral("server");
        case ResolutionChoice::Merge:  return QStringLiteral("merge");
    }
    return QStringLiteral("merge");
}

bool resolutionChoiceFromString(const QString &text, ResolutionChoice *choice)
{
    const QString normalized = text.trimmed().toLower();
    ResolutionChoice parsed;

    if (normalized == "local") {
        parsed = ResolutionChoice::Local;
    } else if (normalized == "server" || normalized == "remote") {
        parsed = ResolutionChoice::Server;
    } else if (normalized == "merge") {
        parsed = ResolutionChoice::Merge;
    } else {
        return false;
    }

    if (choice) {
        *choice = parsed;
    }
    return true;
}

QString operationKindToString(OperationKind kind)
{
    return kind == OperationKind::Pull ? QStringLiteral("pull") : QStringLiteral("sync");
}

OperationKind operationKindFromString(const QString &text)
{
    return text == "pull" ? OperationKind::Pull : OperationKind::Sync;
}

QString healthSeverityToString(HealthSeverity severity)
{
    switch (severity) {
        case HealthSeverity::Info:     return QStringLiteral("info");
        case HealthSeverity::Warning:  return QStringLiteral("warning");
        case HealthSeverity::Critical: return QStringLiteral("critical");
    }
    return QStringLiteral("info");
}

void SyncResult::accumulate(const SyncResult &other)
{
    success = success && other.success;
    synced += other.synced;
    failed += other.failed;
    queued += other.queued;
    pulled += other.pulled;
    conflicts += other.conflicts;
    errors.append(other.errors);
}

void yieldToEventLoop()
{
    if (QCoreApplication::instance()) {
        QCoreApplication::processEvents();
    }
}

} // namespace Stash
