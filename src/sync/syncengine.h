#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>

#include "synctypes.h"
#include "environment.h"
#include "remotebackend.h"
#include "collectionadapter.h"
#include "../conflict/conflictgroup.h"
#include "../queue/queuedoperation.h"
#include "../syncconfig.h"

namespace Stash {

/**
 * @brief Main sync orchestrator
 *
 * The SyncEngine coordinates:
 *   - Pushing unsynced local records in bounded batches
 *   - Classifying push failures (transient vs data-level)
 *   - Pulling remote state and raising conflicts
 *   - Replaying the retry queue
 *   - Periodic and reconnect-triggered auto-sync
 *
 * Usage:
 * @code
 * SyncEnvironment env;
 * env.store = &store;
 * env.queue = &queue;
 * env.conflicts = &resolver;
 * env.remote = &remote;
 * env.identity = &identity;
 * env.network = &network;
 * env.metadata = &metadata;
 * env.scheduler = &scheduler;
 *
 * SyncEngine engine(env, config);
 * for (CollectionAdapter *adapter : createBuiltinAdapters())
 *     engine.registerAdapter(adapter);
 *
 * SyncResults results = engine.syncAll();
 * engine.startAutoSync(60000);
 * @endcode
 *
 * A record is flagged synced only after the remote acknowledged that exact
 * value, or when it was just pulled from the remote. Only one sync pass
 * runs at a time; a trigger during a pass is a no-op.
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    explicit SyncEngine(const SyncEnvironment &environment,
                        const SyncConfig &config = SyncConfig(),
                        QObject *parent = nullptr);
    ~SyncEngine() override;

    // ========== Adapter Management ==========

    /**
     * @brief Register the adapter for a collection
     *
     * The engine takes ownership of the adapter. Its schema is registered
     * with the local store and the conflict resolver.
     */
    void registerAdapter(CollectionAdapter *adapter);

    void unregisterAdapter(const QString &collection);

    CollectionAdapter* adapter(const QString &collection) const;

    /**
     * @brief Registered collections in sync order (priority, then name)
     */
    QStringList registeredCollections() const;

    // ========== Sync Operations ==========

    /**
     * @brief Push and pull every registered collection
     *
     * Returns empty results, without error, when offline, when a pass is
     * already running, or when nobody is signed in. A failure in one
     * collection is recorded in its result and never stops the others.
     */
    SyncResults syncAll();

    /**
     * @brief Push and pull a single collection
     */
    SyncResult syncCollection(const QString &collection);

    /**
     * @brief Pull a single collection without pushing
     */
    SyncResult pullCollection(const QString &collection);

    /**
     * @brief Replay the retry queue through the push path
     *
     * Requires network and a signed-in user; otherwise reports the current
     * queue size without processing anything.
     */
    QueueProcessResult processQueue();

    bool isSyncing() const { return m_syncing; }

    // ========== Auto Sync ==========

    /**
     * @brief Run syncAll() then processQueue() periodically
     * @param intervalMs Period; 0 uses the configured interval
     */
    void startAutoSync(int intervalMs = 0);
    void stopAutoSync();
    bool isAutoSyncActive() const;

    // ========== Conflicts ==========

    QList<ConflictGroup> getConflicts() const;
    QList<ConflictGroup> getConflictsByStore(const QString &collection) const;

    /**
     * @brief Resolve one conflict and persist the outcome
     *
     * "server" is written locally as synced. "local" and "merge" are written
     * unsynced and pushed right away; they are flagged synced only once the
     * remote acknowledges them, and queued for retry otherwise.
     */
    bool resolveConflict(const QString &conflictId, ResolutionChoice choice);

    QList<ResolvedRecord> resolveBatch(const QStringList &conflictIds, ResolutionChoice choice);
    QList<ResolvedRecord> resolveAll(ResolutionChoice choice);

    /**
     * @brief Recommended choice for every pending conflict
     */
    QMap<QString, ResolutionChoice> getDiagnosis() const;

    // ========== Configuration ==========

    SyncConfig config() const { return m_config; }
    void setConfig(const SyncConfig &config);

    const SyncEnvironment &environment() const { return m_env; }

signals:
    void syncStarted();
    void syncFinished(const Stash::SyncResults &results);
    void collectionFinished(const QString &collection, const Stash::SyncResult &result);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);
    void conflictDetected(const QString &collection, const QString &conflictId, const QString &recordName);

private slots:
    void onBecameOnline();

private:
    bool readyToSync(Identity *identity, const char *operation);
    QList<CollectionAdapter*> orderedAdapters() const;

    SyncResult runCollection(CollectionAdapter *adapter, const Identity &identity);
    void pushCollection(CollectionAdapter *adapter, const Identity &identity,
                        SyncResult &result, bool *transientFailure);
    void pushBatch(CollectionAdapter *adapter, const Identity &identity,
                   const QList<QJsonObject> &chunk, SyncResult &result, bool *transientFailure);
    bool pushRecord(CollectionAdapter *adapter, const Identity &identity,
                    const QJsonObject &record, RemoteError *error);
    bool pullRecords(CollectionAdapter *adapter, const Identity &identity,
                     SyncResult &result, bool queueOnFailure);

    /**
     * @brief Flag pushed records synced if they are still unchanged locally
     * @param bulk Commit with one putBulk() rather than a put()
     * @return Number of records flagged
     */
    int commitSynced(const QString &collection, const QList<QJsonObject> &pushed, bool bulk,
                     SyncResult *result = nullptr);

    bool queueRecord(CollectionAdapter *adapter, const QJsonObject &record, const QString &error);
    bool replayOperation(const QueuedOperation &op, const Identity &identity, QString *error);
    void applyResolution(const ResolvedRecord &resolved);
    void runScheduledSync();
    void log(const QString &message);

    SyncEnvironment m_env;
    SyncConfig m_config;
    Clock *m_clock;

    QMap<QString, CollectionAdapter*> m_adapters;

    bool m_syncing = false;
};

} // namespace Stash

#endif // SYNCENGINE_H
