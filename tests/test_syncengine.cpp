/**
 * @file test_syncengine.cpp
 * @brief Unit tests for SyncEngine orchestration
 *
 * Runs the engine against a real LocalStore (SQLite in a temporary
 * directory), a scripted remote, a fixed clock and a manual scheduler.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QJsonObject>
#include "sync/syncengine.h"
#include "sync/syncmetadata.h"
#include "sync/fileremotebackend.h"
#include "sync/adapters/drawingsadapter.h"
#include "sync/adapters/gameprogressadapter.h"
#include "sync/adapters/builtinadapters.h"
#include "store/localstore.h"
#include "queue/retryqueue.h"
#include "conflict/conflictresolver.h"
#include "testdoubles.h"

using namespace Stash;
using namespace StashTest;

class TestSyncEngine : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Registration Tests ==========
    void testRegisteredCollectionsInPriorityOrder();
    void testRegisterRegistersSchemas();

    // ========== Guard Tests ==========
    void testOfflineSkipsSync();
    void testNoIdentitySkipsSync();
    void testSyncWhileSyncingIsNoop();

    // ========== Push Tests ==========
    void testBatchSizeBound();
    void testPushStampsOwner();
    void testIdempotentPush();
    void testTransientBatchFailureQueuesChunk();
    void testConstraintFailureFallsBackPerRecord();
    void testEditDuringPushStaysUnsynced();
    void testConflictedRecordNotPushed();

    // ========== Pull Tests ==========
    void testPulledRecordOverwritesSyncedLocal();
    void testPullRaisesConflictForUnsyncedLocal();
    void testPullAdvancesCursor();
    void testPullReceivesLateEditFromAnotherDevice();
    void testPullDropsConflictOnceRemoteMatches();
    void testGameProgressPullsNewestOnly();
    void testTransientPullQueuesOnePullOperation();

    // ========== Queue Tests ==========
    void testProcessQueueReplaysCurrentRecord();
    void testProcessQueueOfflineIsNoop();
    void testProcessQueueSkipsConflictedRecord();

    // ========== Resolution Tests ==========
    void testResolveServerWritesSynced();
    void testResolveLocalPushesImmediately();
    void testResolveLocalQueuesOnFailure();
    void testResolveAll();

    // ========== Auto Sync Tests ==========
    void testAutoSyncTicks();
    void testAutoSyncStartIsIdempotent();
    void testBecameOnlineTriggersSync();

    // ========== Bookkeeping Tests ==========
    void testMetadataUpdated();
    void testDegradedStoreReconciledBeforeSync();

private:
    void createEngine(bool allAdapters = false);
    QJsonObject drawing(const QString &id, const QString &title, int minute, bool synced = false) const;
    QJsonObject drawingRow(const QString &id, const QString &title, int minute) const;
    QString timestamp(int minute) const;

    QTemporaryDir *m_tempDir;
    FixedClock *m_clock;
    FlakyStorageEngine *m_storage;
    LocalStore *m_store;
    RetryQueue *m_queue;
    ConflictResolver *m_conflicts;
    SyncMetadata *m_metadata;
    MockRemoteBackend *m_remote;
    StaticIdentityProvider *m_identity;
    ManualNetworkStatus *m_network;
    ManualScheduler *m_scheduler;
    SyncEngine *m_engine;
};

void TestSyncEngine::initTestCase()
{
    qDebug() << "Starting SyncEngine tests";
}

void TestSyncEngine::cleanupTestCase()
{
    qDebug() << "SyncEngine tests complete";
}

void TestSyncEngine::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_clock = new FixedClock();
    m_storage = new FlakyStorageEngine(m_tempDir->filePath("stash.sqlite"));
    m_store = new LocalStore(m_storage, m_tempDir->filePath("fallback.ini"), "stash-db");
    QVERIFY(m_store->open());

    m_queue = new RetryQueue(m_tempDir->filePath("retry-queue.json"), m_clock);
    m_conflicts = new ConflictResolver(m_tempDir->filePath("conflicts.json"), m_clock);
    m_metadata = new SyncMetadata(m_tempDir->filePath("sync-metadata.json"));
    m_remote = new MockRemoteBackend();
    m_identity = new StaticIdentityProvider("user-1");
    m_network = new ManualNetworkStatus(true);
    m_scheduler = new ManualScheduler();
    m_engine = nullptr;

    createEngine();
}

void TestSyncEngine::cleanup()
{
    delete m_engine;
    delete m_scheduler;
    delete m_network;
    delete m_identity;
    delete m_remote;
    delete m_metadata;
    delete m_conflicts;
    delete m_queue;
    delete m_store;
    delete m_clock;
    delete m_tempDir;
    m_engine = nullptr;
    m_tempDir = nullptr;
}

void TestSyncEngine::createEngine(bool allAdapters)
{
    delete m_engine;

    SyncEnvironment env;
    env.store = m_store;
    env.queue = m_queue;
    env.conflicts = m_conflicts;
    env.remote = m_remote;
    env.identity = m_identity;
    env.network = m_network;
    env.clock = m_clock;
    env.scheduler = m_scheduler;
    env.metadata = m_metadata;

    m_engine = new SyncEngine(env);

    if (allAdapters) {
        for (CollectionAdapter *adapter : createBuiltinAdapters()) {
            m_engine->registerAdapter(adapter);
        }
    } else {
        m_engine->registerAdapter(new GameProgressAdapter());
        m_engine->registerAdapter(new DrawingsAdapter());
    }
}

QString TestSyncEngine::timestamp(int minute) const
{
    return QDateTime(QDate(2024, 3, 1), QTime(9, 0), QTimeZone::utc())
        .addSecs(minute * 60).toString(Qt::ISODate);
}

QJsonObject TestSyncEngine::drawing(const QString &id, const QString &title, int minute, bool synced) const
{
    return QJsonObject{
        {"id", id},
        {"title", title},
        {"updatedAt", timestamp(minute)},
        {"synced", synced},
    };
}

QJsonObject TestSyncEngine::drawingRow(const QString &id, const QString &title, int minute) const
{
    return QJsonObject{
        {"id", id},
        {"title", title},
        {"updated_at", timestamp(minute)},
        {"user_id", "user-1"},
        {"child_profile_id", QJsonValue::Null},
    };
}

// ========== Registration Tests ==========

void TestSyncEngine::testRegisteredCollectionsInPriorityOrder()
{
    createEngine(true);

    QCOMPARE(m_engine->registeredCollections(),
             QStringList({"childrenProfiles", "gameProgress", "achievements", "stickers", "drawings"}));

    m_engine->syncAll();
    QCOMPARE(m_remote->pullTables(),
             QStringList({"children_profiles", "game_progress", "achievements", "stickers", "drawings"}));
}

void TestSyncEngine::testRegisterRegistersSchemas()
{
    QVERIFY(m_store->hasSchema("drawings"));
    QCOMPARE(m_conflicts->schemaFor("gameProgress").priority, 4);
    QVERIFY(!m_conflicts->schemaFor("gameProgress").incrementalPull);

    m_engine->unregisterAdapter("drawings");
    QVERIFY(m_engine->adapter("drawings") == nullptr);
    QCOMPARE(m_engine->registeredCollections(), QStringList({"gameProgress"}));
}

// ========== Guard Tests ==========

void TestSyncEngine::testOfflineSkipsSync()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    m_network->setOnline(false);

    QSignalSpy startedSpy(m_engine, &SyncEngine::syncStarted);
    QSignalSpy errorSpy(m_engine, &SyncEngine::errorOccurred);

    QVERIFY(m_engine->syncAll().isEmpty());
    QCOMPARE(m_remote->pushCount(), 0);
    QCOMPARE(m_remote->pullCount(), 0);
    QCOMPARE(startedSpy.count(), 0);
    QCOMPARE(errorSpy.count(), 0);
}

void TestSyncEngine::testNoIdentitySkipsSync()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    m_identity->setUserId(QString());

    QVERIFY(m_engine->syncAll().isEmpty());
    QCOMPARE(m_remote->pushCount(), 0);
    QVERIFY(!Records::isSynced(m_store->get("drawings", "d1")));
}

void TestSyncEngine::testSyncWhileSyncingIsNoop()
{
    int innerSize = -1;
    connect(m_engine, &SyncEngine::syncStarted, this, [this, &innerSize]() {
        QVERIFY(m_engine->isSyncing());
        innerSize = m_engine->syncAll().size();
    });

    SyncResults results = m_engine->syncAll();
    QCOMPARE(innerSize, 0);
    QCOMPARE(results.size(), 2);
    QVERIFY(!m_engine->isSyncing());
}

// ========== Push Tests ==========

void TestSyncEngine::testBatchSizeBound()
{
    QList<QJsonObject> records;
    for (int i = 0; i < 120; ++i) {
        records << drawing(QString("d%1").arg(i, 3, 10, QChar('0')), "Doodle", i);
    }
    QVERIFY(m_store->putBulk("drawings", records));
    m_storage->resetCounts();

    SyncResults results = m_engine->syncAll();

    QCOMPARE(m_remote->pushSizes(), QList<int>({50, 50, 20}));
    QCOMPARE(results.value("drawings").synced, 120);
    QCOMPARE(results.value("drawings").failed, 0);
    QVERIFY(results.value("drawings").success);
    QVERIFY(m_store->getUnsynced("drawings").isEmpty());

    // One transaction per acknowledged chunk; nothing new to pull back
    QCOMPARE(m_storage->putBulkCalls(), 3);
    QCOMPARE(results.value("drawings").pulled, 0);
}

void TestSyncEngine::testPushStampsOwner()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    m_engine->syncAll();

    QCOMPARE(m_remote->pushCount(), 1);
    const QJsonObject row = m_remote->pushCalls().first().rows.first();
    QCOMPARE(m_remote->pushCalls().first().table, QString("drawings"));
    QCOMPARE(row.value("user_id").toString(), QString("user-1"));
    QVERIFY(row.value("child_profile_id").isNull());
    QCOMPARE(row.value("updated_at").toString(), timestamp(0));
    QVERIFY(!row.contains("synced"));
}

void TestSyncEngine::testIdempotentPush()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));

    m_engine->syncAll();
    const QJsonObject afterFirst = m_store->get("drawings", "d1");
    m_engine->syncAll();

    QCOMPARE(m_remote->pushCount(), 1);
    QCOMPARE(m_remote->rowCount("drawings"), 1);
    QCOMPARE(m_store->get("drawings", "d1"), afterFirst);
    QVERIFY(Records::isSynced(afterFirst));
}

void TestSyncEngine::testTransientBatchFailureQueuesChunk()
{
    QList<QJsonObject> records;
    for (int i = 0; i < 50; ++i) {
        records << drawing(QString("d%1").arg(i), "Doodle", i);
    }
    QVERIFY(m_store->putBulk("drawings", records));
    m_remote->setTransientPush(true);

    SyncResults results = m_engine->syncAll();
    const SyncResult result = results.value("drawings");

    QCOMPARE(m_remote->pushCount(), 1);
    QCOMPARE(result.synced, 0);
    QCOMPARE(result.failed, 50);
    QCOMPARE(result.queued, 50);
    QVERIFY(!result.success);
    QCOMPARE(m_queue->size(), 50);
    QCOMPARE(m_store->getUnsynced("drawings").size(), 50);

    // The drawings pull is skipped after a transient push failure
    QVERIFY(!m_remote->pullTables().contains("drawings"));
    QVERIFY(m_remote->pullTables().contains("game_progress"));
}

void TestSyncEngine::testConstraintFailureFallsBackPerRecord()
{
    QVERIFY(m_store->putBulk("drawings", {drawing("d0", "A", 0), drawing("d1", "B", 1), drawing("d2", "C", 2)}));
    m_remote->rejectIds({"d1"});

    SyncResults results = m_engine->syncAll();
    const SyncResult result = results.value("drawings");

    QCOMPARE(m_remote->pushSizes(), QList<int>({3, 1, 1, 1}));
    QCOMPARE(result.synced, 2);
    QCOMPARE(result.failed, 1);
    QCOMPARE(result.queued, 1);
    QVERIFY(!result.success);
    QCOMPARE(result.errors.size(), 1);
    QVERIFY(result.errors.first().contains("d1"));

    QVERIFY(Records::isSynced(m_store->get("drawings", "d0")));
    QVERIFY(!Records::isSynced(m_store->get("drawings", "d1")));
    QVERIFY(Records::isSynced(m_store->get("drawings", "d2")));

    QCOMPARE(m_queue->size(), 1);
    const QueuedOperation op = m_queue->getAll().first();
    QCOMPARE(op.recordId(), QString("d1"));
    QCOMPARE(op.priority, 2);
    QVERIFY(op.lastError.contains("not-null"));
}

void TestSyncEngine::testEditDuringPushStaysUnsynced()
{
    QVERIFY(m_store->putBulk("drawings", {drawing("d0", "A", 0), drawing("d1", "B", 1)}));

    bool edited = false;
    m_remote->setPushHook([this, &edited](const QString &, const QList<QJsonObject> &) {
        if (edited) return;
        edited = true;
        QVERIFY(m_store->put("drawings", drawing("d1", "B edited", 5)));
    });

    SyncResults results = m_engine->syncAll();

    QCOMPARE(results.value("drawings").synced, 1);
    QVERIFY(Records::isSynced(m_store->get("drawings", "d0")));

    const QJsonObject d1 = m_store->get("drawings", "d1");
    QVERIFY(!Records::isSynced(d1));
    QCOMPARE(d1.value("title").toString(), QString("B edited"));

    // The pull sees the superseded remote value and leaves the choice to the user
    QVERIFY(m_conflicts->hasConflictFor("drawings", "d1"));
}

void TestSyncEngine::testConflictedRecordNotPushed()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    ConflictGroup group = m_conflicts->detectConflicts("drawings", "d1",
        m_store->get("drawings", "d1"), drawing("d1", "Dog", 0, true));
    QVERIFY(!m_conflicts->addConflict(group).isEmpty());

    SyncResults results = m_engine->syncAll();

    QCOMPARE(m_remote->pushCount(), 0);
    QCOMPARE(results.value("drawings").failed, 0);
    QVERIFY(!Records::isSynced(m_store->get("drawings", "d1")));
}

// ========== Pull Tests ==========

void TestSyncEngine::testPulledRecordOverwritesSyncedLocal()
{
    QVERIFY(m_store->put("gameProgress", QJsonObject{{"id", "a"}, {"score", 10}, {"synced", true}}));
    m_remote->setRow("game_progress", QJsonObject{
        {"id", "a"}, {"score", 10}, {"updated_at", timestamp(30)}, {"user_id", "user-1"},
    });

    SyncResults results = m_engine->syncAll();

    QCOMPARE(results.value("gameProgress").pulled, 1);
    QCOMPARE(results.value("gameProgress").conflicts, 0);
    QCOMPARE(m_conflicts->count(), 0);

    const QJsonObject local = m_store->get("gameProgress", "a");
    QVERIFY(Records::isSynced(local));
    QCOMPARE(local.value("score").toInt(), 10);
    QCOMPARE(local.value("updatedAt").toString(), timestamp(30));
}

void TestSyncEngine::testPullRaisesConflictForUnsyncedLocal()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->rejectIds({"d1"});

    QSignalSpy conflictSpy(m_engine, &SyncEngine::conflictDetected);

    SyncResults results = m_engine->syncAll();

    QCOMPARE(results.value("drawings").conflicts, 1);
    QCOMPARE(conflictSpy.count(), 1);
    QCOMPARE(conflictSpy.first().at(0).toString(), QString("drawings"));
    QCOMPARE(conflictSpy.first().at(2).toString(), QString("Cat"));

    // Local copy untouched
    const QJsonObject local = m_store->get("drawings", "d1");
    QCOMPARE(local.value("title").toString(), QString("Cat"));
    QVERIFY(!Records::isSynced(local));

    QList<ConflictGroup> groups = m_engine->getConflictsByStore("drawings");
    QCOMPARE(groups.size(), 1);
    QCOMPARE(groups.first().fieldNames(), QStringList({"title"}));
    QCOMPARE(m_engine->getDiagnosis().value(groups.first().id), ResolutionChoice::Local);

    // Re-detection on the next pass refreshes the same group
    m_engine->syncAll();
    QCOMPARE(m_engine->getConflicts().size(), 1);
    QCOMPARE(m_engine->getConflicts().first().id, groups.first().id);
}

void TestSyncEngine::testPullAdvancesCursor()
{
    // The remote stored d1 after d2, although d1 was edited earlier
    QJsonObject first = drawingRow("d1", "Cat", 10);
    first.insert("synced_at", timestamp(50));
    QJsonObject second = drawingRow("d2", "Dog", 20);
    second.insert("synced_at", timestamp(40));
    m_remote->setRow("drawings", first);
    m_remote->setRow("drawings", second);

    SyncResults results = m_engine->syncAll();
    QCOMPARE(results.value("drawings").pulled, 2);
    QVERIFY(Records::isSynced(m_store->get("drawings", "d2")));
    QVERIFY(!m_store->get("drawings", "d1").contains("synced_at"));

    const QDateTime cursor = m_metadata->pullCursor("drawings");
    QCOMPARE(cursor, Records::parseTimestamp(timestamp(50)));

    m_remote->resetCalls();
    m_engine->syncAll();

    QCOMPARE(m_remote->pullTables().last(), QString("drawings"));
    const PullQuery query = m_remote->pullQueries().last();
    QCOMPARE(query.updatedSince, cursor);
    QCOMPARE(query.ownerField, QString("user_id"));
    QCOMPARE(query.ownerId, QString("user-1"));
    QCOMPARE(query.timestampField, QString("updated_at"));
    QCOMPARE(query.cursorField, QString("synced_at"));
}

void TestSyncEngine::testPullReceivesLateEditFromAnotherDevice()
{
    // Two devices share this remote; it stamps rows with the test clock
    FileRemoteBackend shared(m_tempDir->filePath("remote"), m_clock);

    SyncEnvironment env;
    env.store = m_store;
    env.queue = m_queue;
    env.conflicts = m_conflicts;
    env.remote = &shared;
    env.identity = m_identity;
    env.network = m_network;
    env.clock = m_clock;
    env.scheduler = m_scheduler;
    env.metadata = m_metadata;

    SyncEngine engine(env);
    engine.registerAdapter(new DrawingsAdapter());

    // The other device edited d2 at minute 20 and this device pulls it
    QVERIFY(shared.push("drawings", {drawingRow("d2", "Dog", 20)}, 1000).ok);
    SyncResults results = engine.syncAll();
    QCOMPARE(results.value("drawings").pulled, 1);
    QCOMPARE(m_metadata->pullCursor("drawings"), m_clock->now());

    // d1 was edited offline at minute 10 and only reaches the remote now
    m_clock->advance(60 * 1000);
    QVERIFY(shared.push("drawings", {drawingRow("d1", "Cat", 10)}, 1000).ok);

    results = engine.syncAll();
    QVERIFY(results.value("drawings").success);
    QCOMPARE(results.value("drawings").pulled, 1);

    const QJsonObject local = m_store->get("drawings", "d1");
    QCOMPARE(local.value("title").toString(), QString("Cat"));
    QCOMPARE(local.value("updatedAt").toString(), timestamp(10));
    QVERIFY(Records::isSynced(local));
    QCOMPARE(m_metadata->pullCursor("drawings"), m_clock->now());
}

void TestSyncEngine::testPullDropsConflictOnceRemoteMatches()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->rejectIds({"d1"});
    m_engine->syncAll();
    QCOMPARE(m_conflicts->count(), 1);
    const QString conflictId = m_engine->getConflicts().first().id;

    // The same edit reaches the remote by another route
    m_remote->setRow("drawings", drawingRow("d1", "Cat", 60));

    SyncResults results = m_engine->syncAll();
    QCOMPARE(results.value("drawings").conflicts, 0);
    QCOMPARE(m_conflicts->count(), 0);
    QVERIFY(!m_conflicts->hasConflictFor("drawings", "d1"));

    // Resolving the old group can no longer write "Dog" back as synced
    QVERIFY(!m_engine->resolveConflict(conflictId, ResolutionChoice::Server));

    const QJsonObject local = m_store->get("drawings", "d1");
    QCOMPARE(local.value("title").toString(), QString("Cat"));
    QVERIFY(Records::isSynced(local));
}

void TestSyncEngine::testGameProgressPullsNewestOnly()
{
    m_remote->setRow("game_progress", QJsonObject{
        {"id", "p1"}, {"score", 5}, {"updated_at", timestamp(10)}, {"user_id", "user-1"},
    });

    m_engine->syncAll();
    m_engine->syncAll();

    QCOMPARE(m_remote->pullTables().first(), QString("game_progress"));
    const PullQuery query = m_remote->pullQueries().at(2);
    QCOMPARE(m_remote->pullTables().at(2), QString("game_progress"));
    QCOMPARE(query.limit, 1);
    QVERIFY(!query.updatedSince.isValid());
    QVERIFY(!m_metadata->pullCursor("gameProgress").isValid());
}

void TestSyncEngine::testTransientPullQueuesOnePullOperation()
{
    m_remote->setTransientPull(true);

    SyncResults results = m_engine->syncAll();
    QVERIFY(!results.value("drawings").success);
    QVERIFY(results.value("drawings").errors.first().contains("timed out"));
    QCOMPARE(m_queue->size(), 2);
    QVERIFY(m_queue->hasPending("drawings", OperationKind::Pull));
    QVERIFY(m_queue->hasPending("gameProgress", OperationKind::Pull));

    m_engine->syncAll();
    QCOMPARE(m_queue->size(), 2);

    m_remote->setTransientPull(false);
    m_remote->setRow("drawings", drawingRow("d1", "Cat", 0));
    m_clock->advance(m_queue->retryDelay(0));

    QueueProcessResult processed = m_engine->processQueue();
    QCOMPARE(processed.processed, 2);
    QCOMPARE(processed.remaining, 0);
    QVERIFY(Records::isSynced(m_store->get("drawings", "d1")));
}

// ========== Queue Tests ==========

void TestSyncEngine::testProcessQueueReplaysCurrentRecord()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    m_remote->setTransientPush(true);
    m_engine->syncAll();
    QCOMPARE(m_queue->size(), 1);

    // Edited after queueing: the replay sends what is stored now
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat v2", 1)));

    m_remote->setTransientPush(false);
    m_remote->resetCalls();
    m_clock->advance(m_queue->retryDelay(0));

    QueueProcessResult result = m_engine->processQueue();
    QCOMPARE(result.processed, 1);
    QCOMPARE(result.remaining, 0);
    QCOMPARE(m_remote->pushCount(), 1);
    QCOMPARE(m_remote->row("drawings", "d1").value("title").toString(), QString("Cat v2"));
    QVERIFY(Records::isSynced(m_store->get("drawings", "d1")));
}

void TestSyncEngine::testProcessQueueOfflineIsNoop()
{
    QVERIFY(m_queue->add(makeSyncOperation("drawings", drawing("d1", "Cat", 0), 2)));
    m_clock->advance(m_queue->retryDelay(0));
    m_network->setOnline(false);

    QueueProcessResult result = m_engine->processQueue();
    QCOMPARE(result.processed, 0);
    QCOMPARE(result.failed, 0);
    QCOMPARE(result.remaining, 1);
    QCOMPARE(m_queue->getAll().first().attempts, 0);
}

void TestSyncEngine::testProcessQueueSkipsConflictedRecord()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->rejectIds({"d1"});
    m_engine->syncAll();
    QCOMPARE(m_queue->size(), 1);
    QCOMPARE(m_conflicts->count(), 1);

    m_remote->resetCalls();
    m_clock->advance(m_queue->retryDelay(0));

    QueueProcessResult result = m_engine->processQueue();
    QCOMPARE(result.processed, 1);
    QCOMPARE(m_remote->pushCount(), 0);
    QVERIFY(m_queue->isEmpty());
}

// ========== Resolution Tests ==========

void TestSyncEngine::testResolveServerWritesSynced()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->rejectIds({"d1"});
    m_engine->syncAll();

    const QString id = m_engine->getConflicts().first().id;
    m_remote->resetCalls();

    QVERIFY(m_engine->resolveConflict(id, ResolutionChoice::Server));
    QCOMPARE(m_remote->pushCount(), 0);
    QVERIFY(m_engine->getConflicts().isEmpty());

    const QJsonObject local = m_store->get("drawings", "d1");
    QCOMPARE(local.value("title").toString(), QString("Dog"));
    QVERIFY(Records::isSynced(local));
}

void TestSyncEngine::testResolveLocalPushesImmediately()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->rejectIds({"d1"});
    m_engine->syncAll();

    const QString id = m_engine->getConflicts().first().id;
    m_remote->rejectIds({});
    m_remote->resetCalls();

    QVERIFY(m_engine->resolveConflict(id, ResolutionChoice::Local));
    QCOMPARE(m_remote->pushCount(), 1);
    QCOMPARE(m_remote->row("drawings", "d1").value("title").toString(), QString("Cat"));

    const QJsonObject local = m_store->get("drawings", "d1");
    QCOMPARE(local.value("title").toString(), QString("Cat"));
    QVERIFY(Records::isSynced(local));

    QVERIFY(!m_engine->resolveConflict(id, ResolutionChoice::Local));
}

void TestSyncEngine::testResolveLocalQueuesOnFailure()
{
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 60)));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->rejectIds({"d1"});
    m_engine->syncAll();
    m_queue->clear();

    const QString id = m_engine->getConflicts().first().id;
    m_remote->setTransientPush(true);

    QVERIFY(m_engine->resolveConflict(id, ResolutionChoice::Merge));

    const QJsonObject local = m_store->get("drawings", "d1");
    QCOMPARE(local.value("title").toString(), QString("Cat"));
    QVERIFY(!Records::isSynced(local));
    QCOMPARE(m_queue->size(), 1);
    QCOMPARE(m_queue->getAll().first().recordId(), QString("d1"));
}

void TestSyncEngine::testResolveAll()
{
    QVERIFY(m_store->putBulk("drawings", {drawing("d1", "Cat", 60), drawing("d2", "Owl", 60)}));
    m_remote->setRow("drawings", drawingRow("d1", "Dog", 0));
    m_remote->setRow("drawings", drawingRow("d2", "Bat", 0));
    m_remote->rejectIds({"d1", "d2"});
    m_engine->syncAll();
    QCOMPARE(m_engine->getConflicts().size(), 2);

    QList<ResolvedRecord> resolved = m_engine->resolveAll(ResolutionChoice::Server);
    QCOMPARE(resolved.size(), 2);
    QVERIFY(m_engine->getConflicts().isEmpty());
    QCOMPARE(m_store->get("drawings", "d2").value("title").toString(), QString("Bat"));
    QVERIFY(m_store->getUnsynced("drawings").isEmpty());
}

// ========== Auto Sync Tests ==========

void TestSyncEngine::testAutoSyncTicks()
{
    m_engine->startAutoSync(1000);
    QVERIFY(m_engine->isAutoSyncActive());
    QCOMPARE(m_scheduler->interval(), 1000);

    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    m_scheduler->fire();
    QVERIFY(Records::isSynced(m_store->get("drawings", "d1")));

    // Offline ticks do nothing
    QVERIFY(m_store->put("drawings", drawing("d2", "Dog", 0)));
    m_network->setOnline(false);
    m_remote->resetCalls();
    m_scheduler->fire();
    QCOMPARE(m_remote->pushCount(), 0);

    m_engine->stopAutoSync();
    QVERIFY(!m_engine->isAutoSyncActive());
}

void TestSyncEngine::testAutoSyncStartIsIdempotent()
{
    m_engine->startAutoSync();
    m_engine->startAutoSync();
    QCOMPARE(m_scheduler->starts(), 1);
    QCOMPARE(m_scheduler->interval(), SyncConfig::DEFAULT_AUTO_SYNC_INTERVAL_MS);

    m_engine->stopAutoSync();
    m_engine->stopAutoSync();
    QVERIFY(!m_engine->isAutoSyncActive());
}

void TestSyncEngine::testBecameOnlineTriggersSync()
{
    m_network->setOnline(false);
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    QVERIFY(m_engine->syncAll().isEmpty());

    QSignalSpy finishedSpy(m_engine, &SyncEngine::syncFinished);
    m_network->setOnline(true);

    QCOMPARE(finishedSpy.count(), 1);
    QVERIFY(Records::isSynced(m_store->get("drawings", "d1")));
}

// ========== Bookkeeping Tests ==========

void TestSyncEngine::testMetadataUpdated()
{
    QVERIFY(m_metadata->isFirstSync());
    QSignalSpy collectionSpy(m_engine, &SyncEngine::collectionFinished);

    m_engine->syncAll();
    QCOMPARE(collectionSpy.count(), 2);
    QCOMPARE(m_metadata->lastSyncTime(), m_clock->now());
    QCOMPARE(m_metadata->lastSyncTime("drawings"), m_clock->now());

    m_remote->setTransientPull(true);
    m_clock->advance(60000);
    m_engine->syncAll();

    QVERIFY(!m_metadata->info("drawings").lastError.isEmpty());
    QCOMPARE(m_metadata->lastSyncTime("drawings"), m_clock->now().addMSecs(-60000));
}

void TestSyncEngine::testDegradedStoreReconciledBeforeSync()
{
    m_storage->setAvailable(false);
    QVERIFY(m_store->put("drawings", drawing("d1", "Cat", 0)));
    QVERIFY(m_store->isDegraded());
    m_storage->setAvailable(true);

    SyncResults results = m_engine->syncAll();

    QVERIFY(!m_store->isDegraded());
    QCOMPARE(results.value("drawings").synced, 1);
    QVERIFY(Records::isSynced(m_store->get("drawings", "d1")));
    QVERIFY(m_store->fallback()->isEmpty());
}

QTEST_MAIN(TestSyncEngine)
#include "test_syncengine.moc"
