#include "syncconfig.h"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <QDebug>

namespace Stash {

namespace {

// Positive integer setting; anything else keeps the default
qint64 readPositive(QSettings &settings, const QString &key, qint64 defaultValue)
{
    if (!settings.contains(key)) {
        return defaultValue;
    }

    bool ok = false;
    qint64 value = settings.value(key).toLongLong(&ok);
    if (!ok || value <= 0) {
        qWarning() << "[SyncConfig] Invalid value for" << key << ":"
                   << settings.value(key).toString() << "- using default" << defaultValue;
        return defaultValue;
    }
    return value;
}

} // namespace

bool SyncConfig::load(const QString &filePath)
{
    QFileInfo info(filePath);
    if (!info.exists()) {
        qDebug() << "[SyncConfig] No config at" << filePath << "- using defaults";
        return true;
    }
    if (!info.isReadable()) {
        qWarning() << "[SyncConfig] Config file not readable:" << filePath;
        return false;
    }

    QSettings settings(filePath, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        qWarning() << "[SyncConfig] Failed to parse" << filePath;
        return false;
    }

    batchSize = static_cast<int>(readPositive(settings, "sync/batchSize", DEFAULT_BATCH_SIZE));
    autoSyncIntervalMs = static_cast<int>(readPositive(settings, "sync/autoSyncIntervalMs",
                                                       DEFAULT_AUTO_SYNC_INTERVAL_MS));
    requestTimeoutMs = static_cast<int>(readPositive(settings, "sync/requestTimeoutMs",
                                                     DEFAULT_REQUEST_TIMEOUT_MS));

    maxAttempts = static_cast<int>(readPositive(settings, "queue/maxAttempts", DEFAULT_MAX_ATTEMPTS));
    baseDelayMs = readPositive(settings, "queue/baseDelayMs", DEFAULT_BASE_DELAY_MS);
    maxDelayMs = readPositive(settings, "queue/maxDelayMs", DEFAULT_MAX_DELAY_MS);
    queueCapacity = static_cast<int>(readPositive(settings, "queue/capacity", DEFAULT_QUEUE_CAPACITY));

    if (maxDelayMs < baseDelayMs) {
        qWarning() << "[SyncConfig] queue/maxDelayMs is below queue/baseDelayMs - using defaults";
        baseDelayMs = DEFAULT_BASE_DELAY_MS;
        maxDelayMs = DEFAULT_MAX_DELAY_MS;
    }

    conflictChunkSize = static_cast<int>(readPositive(settings, "conflicts/chunkSize",
                                                      DEFAULT_CONFLICT_CHUNK_SIZE));

    const QString dbName = settings.value("storage/databaseName", databaseName).toString().trimmed();
    if (dbName.isEmpty()) {
        qWarning() << "[SyncConfig] Empty storage/databaseName - using default";
    } else {
        databaseName = dbName;
    }
    stateDirectory = settings.value("storage/stateDirectory", stateDirectory).toString();

    debugLogging = settings.value("advanced/debugLogging", false).toBool();

    staleSyncHours = static_cast<int>(readPositive(settings, "health/staleSyncHours",
                                                   DEFAULT_STALE_SYNC_HOURS));
    queueBacklogWarning = static_cast<int>(readPositive(settings, "health/queueBacklogWarning",
                                                        DEFAULT_QUEUE_BACKLOG_WARNING));

    qDebug() << "[SyncConfig] Loaded" << filePath;
    return true;
}

bool SyncConfig::save(const QString &filePath) const
{
    QSettings settings(filePath, QSettings::IniFormat);

    settings.setValue("sync/batchSize", batchSize);
    settings.setValue("sync/autoSyncIntervalMs", autoSyncIntervalMs);
    settings.setValue("sync/requestTimeoutMs", requestTimeoutMs);

    settings.setValue("queue/maxAttempts", maxAttempts);
    settings.setValue("queue/baseDelayMs", baseDelayMs);
    settings.setValue("queue/maxDelayMs", maxDelayMs);
    settings.setValue("queue/capacity", queueCapacity);

    settings.setValue("conflicts/chunkSize", conflictChunkSize);

    settings.setValue("storage/databaseName", databaseName);
    if (!stateDirectory.isEmpty()) {
        settings.setValue("storage/stateDirectory", stateDirectory);
    }

    settings.setValue("advanced/debugLogging", debugLogging);

    settings.setValue("health/staleSyncHours", staleSyncHours);
    settings.setValue("health/queueBacklogWarning", queueBacklogWarning);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

QString SyncConfig::resolvedStateDirectory() const
{
    if (!stateDirectory.isEmpty()) {
        return QDir::cleanPath(stateDirectory);
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString SyncConfig::databasePath() const
{
    return QDir(resolvedStateDirectory()).filePath(databaseName + ".sqlite");
}

QString SyncConfig::fallbackPath() const
{
    return QDir(resolvedStateDirectory()).filePath(databaseName + "-fallback.ini");
}

QString SyncConfig::queuePath() const
{
    return QDir(resolvedStateDirectory()).filePath("retry-queue.json");
}

QString SyncConfig::conflictsPath() const
{
    return QDir(resolvedStateDirectory()).filePath("conflicts.json");
}

QString SyncConfig::metadataPath() const
{
    return QDir(resolvedStateDirectory()).filePath("sync-metadata.json");
}

RetryQueueOptions SyncConfig::queueOptions() const
{
    RetryQueueOptions options;
    options.maxAttempts = maxAttempts;
    options.baseDelayMs = baseDelayMs;
    options.maxDelayMs = maxDelayMs;
    options.capacity = queueCapacity;
    return options;
}

} // namespace Stash
