#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for the sync engine
 */

namespace Stash {

/**
 * @brief Conflict resolution strategies
 *
 * Applied to a pending conflict group when the user (or a batch action)
 * decides which version of a record survives.
 */
enum class ResolutionChoice {
    Local,          ///< Keep the local version
    Server,         ///< Keep the remote version
    Merge           ///< Remote version, with locally-newer fields taken from local
};

/**
 * @brief Classification of a failed remote call
 */
enum class RemoteErrorClass {
    Transient,      ///< Network, timeout, 5xx: retry later with the whole batch
    DataLevel       ///< Validation, constraint: isolate the bad record
};

/**
 * @brief Kind of a queued retry operation
 */
enum class OperationKind {
    Sync,           ///< Push one local record
    Pull            ///< Re-run the pull for one collection
};

/**
 * @brief Severity levels for health check results
 */
enum class HealthSeverity {
    Info,
    Warning,
    Critical
};

QString resolutionChoiceToString(ResolutionChoice choice);
bool resolutionChoiceFromString(const QString &text, ResolutionChoice *choice);

QString operationKindToString(OperationKind kind);
OperationKind operationKindFromString(const QString &text);

QString healthSeverityToString(HealthSeverity severity);

/**
 * @brief Result of syncing one collection in one pass
 *
 * Ephemeral, never persisted.
 */
struct SyncResult {
    bool success = true;
    int synced = 0;         ///< Records acknowledged by the remote and marked synced
    int failed = 0;         ///< Records that could not be pushed this pass
    int queued = 0;         ///< Records handed to the retry queue
    int pulled = 0;         ///< Remote records written locally
    int conflicts = 0;      ///< Conflict groups raised by the pull
    QStringList errors;

    void accumulate(const SyncResult &other);

    QString summary() const {
        return QString("Synced: %1, Failed: %2, Queued: %3, Pulled: %4, Conflicts: %5")
            .arg(synced).arg(failed).arg(queued).arg(pulled).arg(conflicts);
    }
};

using SyncResults = QMap<QString, SyncResult>;

/**
 * @brief Outcome of one retry queue run
 */
struct QueueProcessResult {
    int processed = 0;      ///< Operations that succeeded and were removed
    int failed = 0;         ///< Operations that failed (including dropped ones)
    int dropped = 0;        ///< Operations dropped after reaching max attempts
    int skipped = 0;        ///< Operations still inside their backoff window
    int remaining = 0;      ///< Queue size after the run

    QString summary() const {
        return QString("Processed: %1, Failed: %2, Dropped: %3, Skipped: %4, Remaining: %5")
            .arg(processed).arg(failed).arg(dropped).arg(skipped).arg(remaining);
    }
};

/**
 * @brief Snapshot of the retry queue contents
 */
struct QueueStats {
    int total = 0;
    QMap<QString, int> byCollection;
    QMap<QString, int> byKind;
    double averageAttempts = 0.0;
    int deadLetters = 0;
};

/**
 * @brief Snapshot of the pending conflict list
 */
struct ConflictStats {
    int total = 0;
    QMap<QString, int> byStore;
};

/**
 * @brief Give the host event loop a chance to run between work chunks
 *
 * No-op when there is no application object (plain library use).
 */
void yieldToEventLoop();

} // namespace Stash

Q_DECLARE_METATYPE(Stash::SyncResult)
Q_DECLARE_METATYPE(Stash::QueueProcessResult)

#endif // SYNCTYPES_H
