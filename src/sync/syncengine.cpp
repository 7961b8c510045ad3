#include "syncengine.h"
#include "syncmetadata.h"
#include "../store/localstore.h"
#include "../queue/retryqueue.h"
#include "../conflict/conflictresolver.h"

#include <QDebug>

#include <algorithm>
#include <exception>

namespace Stash {

namespace {

// Holds the Syncing state for the lifetime of a pass
struct SyncingGuard {
    bool &flag;
    explicit SyncingGuard(bool &f) : flag(f) { flag = true; }
    ~SyncingGuard() { flag = false; }
};

} // namespace

SyncEngine::SyncEngine(const SyncEnvironment &environment, const SyncConfig &config, QObject *parent)
    : QObject(parent)
    , m_env(environment)
    , m_config(config)
    , m_clock(environment.clock ? environment.clock : SystemClock::instance())
{
    if (!m_env.isComplete()) {
        qCritical() << "[SyncEngine] Created with an incomplete environment";
    }

    if (m_env.queue) {
        m_env.queue->setOptions(m_config.queueOptions());
    }
    if (m_env.conflicts) {
        m_env.conflicts->setChunkSize(m_config.conflictChunkSize);
    }
    if (m_env.network) {
        connect(m_env.network, &NetworkStatus::becameOnline, this, &SyncEngine::onBecameOnline);
    }
}

SyncEngine::~SyncEngine()
{
    stopAutoSync();
    qDeleteAll(m_adapters);
}

void SyncEngine::setConfig(const SyncConfig &config)
{
    m_config = config;
    if (m_env.queue) {
        m_env.queue->setOptions(m_config.queueOptions());
    }
    if (m_env.conflicts) {
        m_env.conflicts->setChunkSize(m_config.conflictChunkSize);
    }
}

// ========== Adapter Management ==========

void SyncEngine::registerAdapter(CollectionAdapter *adapter)
{
    if (!adapter) return;

    const QString name = adapter->collectionName();

    // Replace any existing adapter for the collection
    if (m_adapters.contains(name)) {
        delete m_adapters[name];
    }
    m_adapters[name] = adapter;

    const CollectionSchema schema = adapter->schema();
    if (m_env.store) {
        m_env.store->registerSchema(schema);
    }
    if (m_env.conflicts) {
        m_env.conflicts->registerSchema(schema);
    }

    log(QString("Registered collection: %1 (priority %2)").arg(adapter->displayName()).arg(adapter->priority()));
}

void SyncEngine::unregisterAdapter(const QString &collection)
{
    if (m_adapters.contains(collection)) {
        delete m_adapters.take(collection);
    }
}

CollectionAdapter* SyncEngine::adapter(const QString &collection) const
{
    return m_adapters.value(collection);
}

QStringList SyncEngine::registeredCollections() const
{
    QStringList names;
    for (CollectionAdapter *a : orderedAdapters()) {
        names << a->collectionName();
    }
    return names;
}

QList<CollectionAdapter*> SyncEngine::orderedAdapters() const
{
    QList<CollectionAdapter*> ordered = m_adapters.values();
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const CollectionAdapter *a, const CollectionAdapter *b) {
                         if (a->priority() != b->priority()) {
                             return a->priority() > b->priority();
                         }
                         return a->collectionName() < b->collectionName();
                     });
    return ordered;
}

// ========== Sync Operations ==========

bool SyncEngine::readyToSync(Identity *identity, const char *operation)
{
    if (!m_env.isComplete()) {
        emit errorOccurred(QString("Cannot %1: sync environment is incomplete").arg(operation));
        return false;
    }

    if (m_syncing) {
        qDebug() << "[SyncEngine]" << operation << "skipped: sync already in progress";
        return false;
    }

    if (!m_env.network->isOnline()) {
        log(QString("Offline - skipping %1").arg(operation));
        return false;
    }

    *identity = m_env.identity->currentUser();
    if (!identity->isValid()) {
        log(QString("No signed-in user - skipping %1").arg(operation));
        return false;
    }

    return true;
}

SyncResults SyncEngine::syncAll()
{
    SyncResults results;

    Identity identity;
    if (!readyToSync(&identity, "sync")) {
        return results;
    }

    SyncingGuard guard(m_syncing);
    emit syncStarted();

    if (m_env.store->isDegraded()) {
        m_env.store->reconcileFallback();
    }

    const QList<CollectionAdapter*> adapters = orderedAdapters();
    QStringList order;
    for (CollectionAdapter *a : adapters) {
        order << a->collectionName();
    }
    log(QString("Starting sync for user %1: %2").arg(identity.userId, order.join(" → ")));

    SyncResult total;
    for (CollectionAdapter *a : adapters) {
        const QString name = a->collectionName();
        SyncResult result;

        try {
            result = runCollection(a, identity);
        } catch (const std::exception &e) {
            result.success = false;
            result.errors << QString("Unexpected error: %1").arg(QString::fromUtf8(e.what()));
            qCritical() << "[SyncEngine] Unexpected error syncing" << name << ":" << e.what();
            emit errorOccurred(QString("%1: %2").arg(name, result.errors.last()));
        }

        results.insert(name, result);
        total.accumulate(result);
        emit collectionFinished(name, result);

        yieldToEventLoop();
    }

    m_env.metadata->setLastSyncTime(m_clock->now());

    log(QString("Sync complete. %1").arg(total.summary()));
    emit syncFinished(results);
    return results;
}

SyncResult SyncEngine::syncCollection(const QString &collection)
{
    SyncResult result;

    CollectionAdapter *a = m_adapters.value(collection);
    if (!a) {
        result.success = false;
        result.errors << QString("Unknown collection: %1").arg(collection);
        emit errorOccurred(result.errors.last());
        return result;
    }

    Identity identity;
    if (!readyToSync(&identity, "sync")) {
        return result;
    }

    SyncingGuard guard(m_syncing);

    try {
        result = runCollection(a, identity);
    } catch (const std::exception &e) {
        result.success = false;
        result.errors << QString("Unexpected error: %1").arg(QString::fromUtf8(e.what()));
        emit errorOccurred(QString("%1: %2").arg(collection, result.errors.last()));
    }

    emit collectionFinished(collection, result);
    return result;
}

SyncResult SyncEngine::pullCollection(const QString &collection)
{
    SyncResult result;

    CollectionAdapter *a = m_adapters.value(collection);
    if (!a) {
        result.success = false;
        result.errors << QString("Unknown collection: %1").arg(collection);
        emit errorOccurred(result.errors.last());
        return result;
    }

    Identity identity;
    if (!readyToSync(&identity, "pull")) {
        return result;
    }

    SyncingGuard guard(m_syncing);
    pullRecords(a, identity, result, true);
    emit collectionFinished(collection, result);
    return result;
}

SyncResult SyncEngine::runCollection(CollectionAdapter *adapter, const Identity &identity)
{
    const QString name = adapter->collectionName();
    SyncResult result;

    log(QString("=== %1 ===").arg(adapter->displayName()));

    bool transientFailure = false;
    pushCollection(adapter, identity, result, &transientFailure);

    if (transientFailure) {
        // Remote is unreachable right now; the pull would fail the same way
        log(QString("Skipping pull of %1 after transient push failure").arg(name));
    } else {
        pullRecords(adapter, identity, result, true);
    }

    if (result.success) {
        m_env.metadata->setLastSyncTime(name, m_clock->now());
    } else if (!result.errors.isEmpty()) {
        m_env.metadata->setLastError(name, result.errors.last());
    }

    log(QString("%1: %2").arg(name, result.summary()));
    return result;
}

// ========== Push ==========

void SyncEngine::pushCollection(CollectionAdapter *adapter, const Identity &identity,
                                SyncResult &result, bool *transientFailure)
{
    const QString name = adapter->collectionName();

    // Records waiting on a conflict decision stay put until it is made
    QList<QJsonObject> pending;
    const QList<QJsonObject> unsynced = m_env.store->getUnsynced(name);
    for (const QJsonObject &record : unsynced) {
        if (!m_env.conflicts->hasConflictFor(name, Records::idOf(record))) {
            pending.append(record);
        }
    }

    if (pending.isEmpty()) {
        return;
    }

    const int batchSize = std::max(1, m_config.batchSize);
    log(QString("Pushing %1 %2 record(s) in batches of %3").arg(pending.size()).arg(name).arg(batchSize));

    for (int start = 0; start < pending.size(); start += batchSize) {
        pushBatch(adapter, identity, pending.mid(start, batchSize), result, transientFailure);
    }
}

void SyncEngine::pushBatch(CollectionAdapter *adapter, const Identity &identity,
                           const QList<QJsonObject> &chunk, SyncResult &result, bool *transientFailure)
{
    const QString name = adapter->collectionName();

    QList<QJsonObject> rows;
    rows.reserve(chunk.size());
    for (const QJsonObject &record : chunk) {
        rows.append(adapter->toWire(record, identity));
    }

    PushResult pushed = m_env.remote->push(adapter->remoteTable(), rows, m_config.requestTimeoutMs);
    if (pushed.ok) {
        result.synced += commitSynced(name, chunk, true, &result);
        return;
    }

    const QString error = pushed.error.describe();

    if (classifyRemoteError(pushed.error) == RemoteErrorClass::Transient) {
        // Retrying now would most likely fail the same way: queue the chunk
        log(QString("Transient failure pushing %1 %2 record(s), queueing: %3")
                .arg(chunk.size()).arg(name, error));
        for (const QJsonObject &record : chunk) {
            if (queueRecord(adapter, record, error)) {
                result.queued++;
            }
        }
        result.failed += chunk.size();
        result.success = false;
        result.errors << QString("Push failed: %1").arg(error);
        *transientFailure = true;
        return;
    }

    // Data-level: isolate the offending record(s)
    log(QString("Batch push of %1 rejected (%2), retrying record by record").arg(name, error));

    for (const QJsonObject &record : chunk) {
        RemoteError recordError;
        if (pushRecord(adapter, identity, record, &recordError)) {
            result.synced += commitSynced(name, {record}, false, &result);
            continue;
        }

        const QString message = recordError.describe();
        qWarning() << "[SyncEngine] Record" << Records::idOf(record) << "of" << name
                   << "rejected:" << message;
        result.failed++;
        result.success = false;
        result.errors << QString("%1/%2: %3").arg(name, Records::idOf(record), message);
        if (queueRecord(adapter, record, message)) {
            result.queued++;
        }
    }
}

bool SyncEngine::pushRecord(CollectionAdapter *adapter, const Identity &identity,
                            const QJsonObject &record, RemoteError *error)
{
    PushResult pushed = m_env.remote->push(adapter->remoteTable(),
                                           {adapter->toWire(record, identity)},
                                           m_config.requestTimeoutMs);
    if (!pushed.ok && error) {
        *error = pushed.error;
    }
    return pushed.ok;
}

int SyncEngine::commitSynced(const QString &collection, const QList<QJsonObject> &pushed, bool bulk,
                             SyncResult *result)
{
    QList<QJsonObject> acknowledged;
    for (const QJsonObject &record : pushed) {
        const QJsonObject current = m_env.store->get(collection, Records::idOf(record));
        if (current.isEmpty()) {
            continue;  // Deleted meanwhile
        }
        if (!Records::sameContent(current, record)) {
            qDebug() << "[SyncEngine]" << collection << Records::idOf(record)
                     << "changed during push, leaving unsynced";
            continue;
        }
        acknowledged.append(Records::withSynced(current, true));
    }

    if (acknowledged.isEmpty()) {
        return 0;
    }

    const bool stored = bulk ? m_env.store->putBulk(collection, acknowledged)
                             : m_env.store->put(collection, acknowledged.first());
    if (!stored) {
        const QString error = QString("Failed to mark %1 %2 record(s) synced: %3")
            .arg(acknowledged.size()).arg(collection, m_env.store->lastError());
        qWarning() << "[SyncEngine]" << error;
        emit errorOccurred(error);
        if (result) {
            result->success = false;
            result->errors << error;
        }
        return 0;
    }

    return acknowledged.size();
}

bool SyncEngine::queueRecord(CollectionAdapter *adapter, const QJsonObject &record, const QString &error)
{
    if (m_env.queue->add(makeSyncOperation(adapter->collectionName(), record, adapter->priority(), error))) {
        return true;
    }

    // The record is still unsynced locally; the next pass picks it up again
    qWarning() << "[SyncEngine] Could not queue" << adapter->collectionName() << Records::idOf(record);
    return false;
}

// ========== Pull ==========

bool SyncEngine::pullRecords(CollectionAdapter *adapter, const Identity &identity,
                             SyncResult &result, bool queueOnFailure)
{
    const QString name = adapter->collectionName();

    const QDateTime since = adapter->supportsIncrementalPull()
        ? m_env.metadata->pullCursor(name) : QDateTime();
    const PullQuery query = adapter->pullQuery(identity, since);
    PullResult pulled = m_env.remote->pull(adapter->remoteTable(), query,
                                           m_config.requestTimeoutMs);

    if (!pulled.ok) {
        const QString error = pulled.error.describe();
        result.success = false;
        result.errors << QString("Pull failed: %1").arg(error);
        qWarning() << "[SyncEngine] Pull of" << name << "failed:" << error;

        if (queueOnFailure
            && classifyRemoteError(pulled.error) == RemoteErrorClass::Transient
            && !m_env.queue->hasPending(name, OperationKind::Pull)) {
            m_env.queue->add(makePullOperation(name, adapter->priority(), error));
        }
        return false;
    }

    QList<QJsonObject> upserts;
    QDateTime newest;

    for (const QJsonObject &row : pulled.records) {
        // The cursor follows the remote's clock, never the editing device's
        const QDateTime storedAt = Records::parseTimestamp(row.value(query.cursorField));
        if (Records::compareTimestamps(storedAt, newest) > 0) {
            newest = storedAt;
        }

        const QJsonObject remote = adapter->fromWire(row);
        const QString id = Records::idOf(remote);
        if (id.isEmpty()) {
            qWarning() << "[SyncEngine] Ignoring pulled" << name << "row without id";
            continue;
        }

        const QJsonObject local = m_env.store->get(name, id);
        if (!local.isEmpty() && !Records::isSynced(local)) {
            ConflictGroup group = m_env.conflicts->detectConflicts(name, id, local, remote,
                                                                   adapter->recordName(local));
            if (group.isValid()) {
                const QString conflictId = m_env.conflicts->addConflict(group);
                result.conflicts++;
                log(QString("Conflict on %1 \"%2\": %3")
                        .arg(name, group.recordName, group.fieldNames().join(", ")));
                emit conflictDetected(name, conflictId, group.recordName);
                continue;
            }
        }

        // Local and remote agree now: an earlier group would resolve to stale data
        if (m_env.conflicts->removeConflictFor(name, id)) {
            log(QString("Conflict on %1 \"%2\" no longer applies").arg(name, id));
        }

        if (!local.isEmpty() && Records::isSynced(local) && Records::sameContent(local, remote)) {
            continue;  // Already current
        }

        upserts.append(Records::withSynced(remote, true));
    }

    if (!upserts.isEmpty()) {
        if (!m_env.store->putBulk(name, upserts)) {
            const QString error = QString("Failed to store %1 pulled %2 record(s): %3")
                .arg(upserts.size()).arg(name, m_env.store->lastError());
            result.success = false;
            result.errors << error;
            emit errorOccurred(error);
            return false;
        }
        result.pulled += upserts.size();
    }

    if (adapter->supportsIncrementalPull()) {
        m_env.metadata->advancePullCursor(name, newest);
    }
    return true;
}

// ========== Retry Queue ==========

QueueProcessResult SyncEngine::processQueue()
{
    Identity identity;
    if (!readyToSync(&identity, "queue processing")) {
        QueueProcessResult skipped;
        skipped.remaining = m_env.queue ? m_env.queue->size() : 0;
        return skipped;
    }

    log(QString("Processing retry queue (%1 operation(s))").arg(m_env.queue->size()));

    QueueProcessResult result = m_env.queue->processQueue(
        [this, identity](const QueuedOperation &op, QString *error) {
            return replayOperation(op, identity, error);
        });

    log(QString("Retry queue: %1").arg(result.summary()));
    return result;
}

bool SyncEngine::replayOperation(const QueuedOperation &op, const Identity &identity, QString *error)
{
    CollectionAdapter *a = m_adapters.value(op.collection);
    if (!a) {
        *error = QString("No adapter registered for %1").arg(op.collection);
        return false;
    }

    if (op.kind == OperationKind::Pull) {
        SyncResult result;
        if (pullRecords(a, identity, result, false)) {
            return true;
        }
        *error = result.errors.join("; ");
        return false;
    }

    // Push what is stored now, not the payload captured when the op was queued
    const QString id = op.recordId();
    const QJsonObject current = m_env.store->get(op.collection, id);
    if (current.isEmpty()) {
        qDebug() << "[SyncEngine] Queued record" << op.collection << id << "no longer exists";
        return true;
    }
    if (Records::isSynced(current)) {
        return true;
    }
    if (m_env.conflicts->hasConflictFor(op.collection, id)) {
        // Resolution pushes the record
        return true;
    }

    RemoteError remoteError;
    if (!pushRecord(a, identity, current, &remoteError)) {
        *error = remoteError.describe();
        return false;
    }

    commitSynced(op.collection, {current}, false);
    return true;
}

// ========== Auto Sync ==========

void SyncEngine::startAutoSync(int intervalMs)
{
    if (!m_env.scheduler) {
        qWarning() << "[SyncEngine] Auto-sync unavailable: no scheduler";
        return;
    }

    const int interval = intervalMs > 0 ? intervalMs : m_config.autoSyncIntervalMs;
    if (m_env.scheduler->isActive() && interval == m_config.autoSyncIntervalMs) {
        return;
    }

    m_config.autoSyncIntervalMs = interval;
    m_env.scheduler->start(interval, [this]() { runScheduledSync(); });
    log(QString("Auto-sync every %1 ms").arg(interval));
}

void SyncEngine::stopAutoSync()
{
    if (!m_env.scheduler || !m_env.scheduler->isActive()) {
        return;
    }

    m_env.scheduler->stop();
    log("Auto-sync stopped");
}

bool SyncEngine::isAutoSyncActive() const
{
    return m_env.scheduler && m_env.scheduler->isActive();
}

void SyncEngine::runScheduledSync()
{
    if (m_syncing || !m_env.network || !m_env.network->isOnline()) {
        return;
    }

    syncAll();
    processQueue();
}

void SyncEngine::onBecameOnline()
{
    log("Connection restored, syncing");
    runScheduledSync();
}

// ========== Conflicts ==========

QList<ConflictGroup> SyncEngine::getConflicts() const
{
    return m_env.conflicts->getConflicts();
}

QList<ConflictGroup> SyncEngine::getConflictsByStore(const QString &collection) const
{
    return m_env.conflicts->getConflictsByStore(collection);
}

bool SyncEngine::resolveConflict(const QString &conflictId, ResolutionChoice choice)
{
    ResolvedRecord resolved;
    if (!m_env.conflicts->resolveConflict(conflictId, choice, &resolved)) {
        emit errorOccurred(QString("Conflict not found: %1").arg(conflictId));
        return false;
    }

    applyResolution(resolved);
    return true;
}

QList<ResolvedRecord> SyncEngine::resolveBatch(const QStringList &conflictIds, ResolutionChoice choice)
{
    const QList<ResolvedRecord> resolved = m_env.conflicts->resolveBatch(conflictIds, choice);
    for (const ResolvedRecord &record : resolved) {
        applyResolution(record);
    }
    return resolved;
}

QList<ResolvedRecord> SyncEngine::resolveAll(ResolutionChoice choice)
{
    const QList<ResolvedRecord> resolved = m_env.conflicts->resolveAll(choice);
    for (const ResolvedRecord &record : resolved) {
        applyResolution(record);
    }
    return resolved;
}

QMap<QString, ResolutionChoice> SyncEngine::getDiagnosis() const
{
    return m_env.conflicts->getDiagnosis();
}

void SyncEngine::applyResolution(const ResolvedRecord &resolved)
{
    const QString name = resolved.collection;

    if (resolved.choice == ResolutionChoice::Server) {
        if (!m_env.store->put(name, Records::withSynced(resolved.data, true))) {
            emit errorOccurred(QString("Failed to store resolved %1/%2").arg(name, resolved.recordId));
        }
        return;
    }

    // The remote has not seen this value yet
    const QJsonObject record = Records::withSynced(resolved.data, false);
    if (!m_env.store->put(name, record)) {
        emit errorOccurred(QString("Failed to store resolved %1/%2").arg(name, resolved.recordId));
        return;
    }

    CollectionAdapter *a = m_adapters.value(name);
    const Identity identity = m_env.identity->currentUser();
    if (!a || !m_env.network->isOnline() || !identity.isValid()) {
        log(QString("Resolved %1/%2 will be pushed on the next sync").arg(name, resolved.recordId));
        return;
    }

    RemoteError error;
    if (pushRecord(a, identity, record, &error)) {
        commitSynced(name, {record}, false);
        return;
    }

    log(QString("Push of resolved %1/%2 failed, queued: %3").arg(name, resolved.recordId, error.describe()));
    queueRecord(a, record, error.describe());
}

// ========== Helpers ==========

void SyncEngine::log(const QString &message)
{
    qInfo().noquote() << "[SyncEngine]" << message;
    emit logMessage(message);
}

} // namespace Stash
