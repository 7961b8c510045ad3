#ifndef SYNCMETADATA_H
#define SYNCMETADATA_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QMap>

namespace Stash {

/**
 * @brief Per-collection bookkeeping for one sync pass
 */
struct CollectionSyncInfo {
    QDateTime lastSyncTime;     ///< Last pass that completed without errors
    QDateTime pullCursor;       ///< Newest remote timestamp seen by a pull
    QString lastError;          ///< Error of the most recent failed pass, if any
};

/**
 * @brief Persistent sync bookkeeping
 *
 * Stored as JSON:
 *   {
 *     "version": 1,
 *     "lastSyncTime": "...",
 *     "collections": {
 *       "<name>": { "lastSyncTime": "...", "pullCursor": "...", "lastError": "..." }
 *     }
 *   }
 *
 * The pull cursor lets collections that support it fetch only rows
 * updated since the previous pull.
 */
class SyncMetadata : public QObject
{
    Q_OBJECT

public:
    /**
     * @param filePath JSON file the metadata persists to; loaded immediately
     */
    explicit SyncMetadata(const QString &filePath, QObject *parent = nullptr);
    ~SyncMetadata() override;

    // ========== Overall ==========

    /**
     * @brief Completion time of the last syncAll() pass
     */
    QDateTime lastSyncTime() const { return m_lastSyncTime; }
    void setLastSyncTime(const QDateTime &time);

    bool isFirstSync() const { return !m_lastSyncTime.isValid(); }

    // ========== Per Collection ==========

    CollectionSyncInfo info(const QString &collection) const { return m_collections.value(collection); }
    QStringList collections() const { return m_collections.keys(); }

    QDateTime lastSyncTime(const QString &collection) const;
    void setLastSyncTime(const QString &collection, const QDateTime &time);

    QDateTime pullCursor(const QString &collection) const;

    /**
     * @brief Move the cursor forward; older values are ignored
     */
    void advancePullCursor(const QString &collection, const QDateTime &cursor);
    void resetPullCursor(const QString &collection);

    void setLastError(const QString &collection, const QString &error);

    void clear();

    // ========== Persistence ==========

    bool load();
    bool save();

    QString filePath() const { return m_filePath; }

signals:
    void metadataChanged();
    void errorOccurred(const QString &error);

private:
    QString m_filePath;
    QDateTime m_lastSyncTime;
    QMap<QString, CollectionSyncInfo> m_collections;
};

} // namespace Stash

#endif // SYNCMETADATA_H
