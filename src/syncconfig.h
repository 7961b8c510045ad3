#ifndef SYNCCONFIG_H
#define SYNCCONFIG_H

#include <QString>

#include "queue/retryqueue.h"

namespace Stash {

/**
 * @brief Engine tuning, loaded from an INI file
 *
 * Example stashsync.conf:
 *
 *   [sync]
 *   batchSize=50
 *   autoSyncIntervalMs=60000
 *   requestTimeoutMs=30000
 *
 *   [queue]
 *   maxAttempts=5
 *   baseDelayMs=2000
 *   maxDelayMs=300000
 *   capacity=1000
 *
 *   [conflicts]
 *   chunkSize=10
 *
 *   [storage]
 *   databaseName=stash-db
 *   stateDirectory=/home/me/.local/share/StashSync
 *
 *   [advanced]
 *   debugLogging=false
 *
 *   [health]
 *   staleSyncHours=24
 *   queueBacklogWarning=100
 *
 * Missing keys take their defaults. Out-of-range values are replaced by the
 * default with a warning.
 */
struct SyncConfig
{
    // Sync
    int batchSize = DEFAULT_BATCH_SIZE;
    int autoSyncIntervalMs = DEFAULT_AUTO_SYNC_INTERVAL_MS;
    int requestTimeoutMs = DEFAULT_REQUEST_TIMEOUT_MS;

    // Retry queue
    int maxAttempts = DEFAULT_MAX_ATTEMPTS;
    qint64 baseDelayMs = DEFAULT_BASE_DELAY_MS;
    qint64 maxDelayMs = DEFAULT_MAX_DELAY_MS;
    int queueCapacity = DEFAULT_QUEUE_CAPACITY;

    // Conflicts
    int conflictChunkSize = DEFAULT_CONFLICT_CHUNK_SIZE;

    // Storage
    QString databaseName = QStringLiteral("stash-db");
    QString stateDirectory;         ///< Empty: application data location

    // Advanced
    bool debugLogging = false;

    // Health
    int staleSyncHours = DEFAULT_STALE_SYNC_HOURS;
    int queueBacklogWarning = DEFAULT_QUEUE_BACKLOG_WARNING;

    /**
     * @brief Read values from an INI file
     * @return false if the file exists but cannot be read; defaults are kept
     */
    bool load(const QString &filePath);

    bool save(const QString &filePath) const;

    /**
     * @brief State directory, falling back to the application data location
     */
    QString resolvedStateDirectory() const;

    QString databasePath() const;
    QString fallbackPath() const;
    QString queuePath() const;
    QString conflictsPath() const;
    QString metadataPath() const;

    RetryQueueOptions queueOptions() const;

    static constexpr int DEFAULT_BATCH_SIZE = 50;
    static constexpr int DEFAULT_AUTO_SYNC_INTERVAL_MS = 60000;
    static constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 30000;
    static constexpr int DEFAULT_MAX_ATTEMPTS = 5;
    static constexpr qint64 DEFAULT_BASE_DELAY_MS = 2000;
    static constexpr qint64 DEFAULT_MAX_DELAY_MS = 300000;
    static constexpr int DEFAULT_QUEUE_CAPACITY = 1000;
    static constexpr int DEFAULT_CONFLICT_CHUNK_SIZE = 10;
    static constexpr int DEFAULT_STALE_SYNC_HOURS = 24;
    static constexpr int DEFAULT_QUEUE_BACKLOG_WARNING = 100;
};

} // namespace Stash

#endif // SYNCCONFIG_H
