/**
 * @file testdoubles.h
 * @brief In-test stand-ins for the remote, clock, scheduler and storage
 */

#ifndef TESTDOUBLES_H
#define TESTDOUBLES_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>
#include <QSet>
#include <QDateTime>
#include <QJsonObject>
#include <QTimeZone>

#include <functional>

#include "sync/environment.h"
#include "sync/remotebackend.h"
#include "sync/collectionschema.h"
#include "store/sqlitestorageengine.h"

namespace StashTest {

using namespace Stash;

// ========== Clock ==========

class FixedClock : public Clock
{
public:
    explicit FixedClock(const QDateTime &start = QDateTime(QDate(2024, 3, 1), QTime(12, 0), QTimeZone::utc()))
        : m_now(start) {}

    QDateTime now() const override { return m_now; }

    void set(const QDateTime &time) { m_now = time; }
    void advance(qint64 msecs) { m_now = m_now.addMSecs(msecs); }

private:
    QDateTime m_now;
};

// ========== Scheduler ==========

class ManualScheduler : public PeriodicScheduler
{
public:
    void start(int intervalMs, std::function<void()> task) override
    {
        m_interval = intervalMs;
        m_task = task;
        m_active = true;
        m_starts++;
    }

    void stop() override
    {
        m_active = false;
        m_task = nullptr;
    }

    bool isActive() const override { return m_active; }

    /// Run one tick, as the timer would
    void fire()
    {
        if (m_active && m_task) {
            m_task();
        }
    }

    int interval() const { return m_interval; }
    int starts() const { return m_starts; }

private:
    std::function<void()> m_task;
    int m_interval = 0;
    int m_starts = 0;
    bool m_active = false;
};

// ========== Remote ==========

/**
 * @brief Scriptable remote
 *
 * By default every push is an upsert into an in-memory table and every pull
 * returns the table contents. Failures are switched on per test.
 */
class MockRemoteBackend : public RemoteBackend
{
    Q_OBJECT

public:
    struct PushCall {
        QString table;
        QList<QJsonObject> rows;
    };

    explicit MockRemoteBackend(QObject *parent = nullptr) : RemoteBackend(parent) {}

    QString backendId() const override { return "mock"; }
    QString displayName() const override { return "Mock Remote"; }

    PushResult push(const QString &table, const QList<QJsonObject> &rows, int timeoutMs) override
    {
        Q_UNUSED(timeoutMs);
        m_pushCalls.append({table, rows});

        if (m_pushHook) {
            m_pushHook(table, rows);
        }

        if (m_transientPush) {
            RemoteError error;
            error.networkFailure = true;
            error.message = "Failed to fetch";
            return PushResult::failure(error);
        }

        for (const QJsonObject &row : rows) {
            if (m_rejectedIds.contains(Records::idOf(row))) {
                RemoteError error;
                error.status = 400;
                error.code = "23502";
                error.message = QString("null value in column \"%1\" violates not-null constraint")
                    .arg(m_rejectedColumn);
                return PushResult::failure(error);
            }
        }

        for (const QJsonObject &row : rows) {
            m_tables[table].insert(Records::idOf(row), row);
        }
        return PushResult::success();
    }

    PullResult pull(const QString &table, const PullQuery &query, int timeoutMs) override
    {
        Q_UNUSED(timeoutMs);
        m_pullQueries.append(query);
        m_pullTables.append(table);

        if (m_transientPull) {
            RemoteError error;
            error.timedOut = true;
            error.message = "Request timed out";
            return PullResult::failure(error);
        }

        PullResult result;
        result.records = m_tables.value(table).values();
        return result;
    }

    // ========== Scripting ==========

    void setTransientPush(bool on) { m_transientPush = on; }
    void setTransientPull(bool on) { m_transientPull = on; }

    /// Runs inside push(), before the rows are accepted
    void setPushHook(std::function<void(const QString &, const QList<QJsonObject> &)> hook)
    {
        m_pushHook = hook;
    }

    /// Rows with these ids are rejected as a constraint violation
    void rejectIds(const QStringList &ids, const QString &column = "user_id")
    {
        m_rejectedIds = QSet<QString>(ids.begin(), ids.end());
        m_rejectedColumn = column;
    }

    void setRow(const QString &table, const QJsonObject &row) { m_tables[table].insert(Records::idOf(row), row); }
    QJsonObject row(const QString &table, const QString &id) const { return m_tables.value(table).value(id); }
    int rowCount(const QString &table) const { return m_tables.value(table).size(); }

    // ========== Inspection ==========

    QList<PushCall> pushCalls() const { return m_pushCalls; }
    int pushCount() const { return m_pushCalls.size(); }
    QList<int> pushSizes() const
    {
        QList<int> sizes;
        for (const PushCall &call : m_pushCalls) {
            sizes << call.rows.size();
        }
        return sizes;
    }

    QList<PullQuery> pullQueries() const { return m_pullQueries; }
    QStringList pullTables() const { return m_pullTables; }
    int pullCount() const { return m_pullQueries.size(); }

    void resetCalls()
    {
        m_pushCalls.clear();
        m_pullQueries.clear();
        m_pullTables.clear();
    }

private:
    QMap<QString, QMap<QString, QJsonObject>> m_tables;
    QList<PushCall> m_pushCalls;
    QList<PullQuery> m_pullQueries;
    QStringList m_pullTables;
    std::function<void(const QString &, const QList<QJsonObject> &)> m_pushHook;
    QSet<QString> m_rejectedIds;
    QString m_rejectedColumn;
    bool m_transientPush = false;
    bool m_transientPull = false;
};

// ========== Storage ==========

/**
 * @brief SQLite engine that can be switched off to simulate a storage outage
 *
 * Counts putBulk() calls so tests can check how many transactions a sync
 * pass commits, and getUnsynced() calls to show reads go through its index.
 */
class FlakyStorageEngine : public SqliteStorageEngine
{
public:
    explicit FlakyStorageEngine(const QString &databasePath) : SqliteStorageEngine(databasePath) {}

    void setAvailable(bool available) { m_available = available; }
    int putBulkCalls() const { return m_putBulkCalls; }
    int putCalls() const { return m_putCalls; }
    int getUnsyncedCalls() const { return m_getUnsyncedCalls; }
    void resetCounts() { m_putBulkCalls = 0; m_putCalls = 0; m_getUnsyncedCalls = 0; }

    StorageStatus open() override
    {
        if (!m_available) return StorageStatus::unavailable("disk unavailable");
        return SqliteStorageEngine::open();
    }

    StorageResult<QJsonObject> get(const QString &collection, const QString &id) override
    {
        if (!m_available) return StorageResult<QJsonObject>::unavailable("disk unavailable");
        return SqliteStorageEngine::get(collection, id);
    }

    StorageResult<QList<QJsonObject>> getAll(const QString &collection) override
    {
        if (!m_available) return StorageResult<QList<QJsonObject>>::unavailable("disk unavailable");
        return SqliteStorageEngine::getAll(collection);
    }

    StorageResult<QList<QJsonObject>> getUnsynced(const QString &collection) override
    {
        m_getUnsyncedCalls++;
        if (!m_available) return StorageResult<QList<QJsonObject>>::unavailable("disk unavailable");
        return SqliteStorageEngine::getUnsynced(collection);
    }

    StorageStatus put(const QString &collection, const QJsonObject &record) override
    {
        m_putCalls++;
        if (!m_available) return StorageStatus::unavailable("disk unavailable");
        return SqliteStorageEngine::put(collection, record);
    }

    StorageStatus putBulk(const QString &collection, const QList<QJsonObject> &records) override
    {
        m_putBulkCalls++;
        if (!m_available) return StorageStatus::unavailable("disk unavailable");
        return SqliteStorageEngine::putBulk(collection, records);
    }

    StorageStatus remove(const QString &collection, const QString &id) override
    {
        if (!m_available) return StorageStatus::unavailable("disk unavailable");
        return SqliteStorageEngine::remove(collection, id);
    }

    StorageStatus clear(const QString &collection) override
    {
        if (!m_available) return StorageStatus::unavailable("disk unavailable");
        return SqliteStorageEngine::clear(collection);
    }

private:
    bool m_available = true;
    int m_putBulkCalls = 0;
    int m_putCalls = 0;
    int m_getUnsyncedCalls = 0;
};

} // namespace StashTest

#endif // TESTDOUBLES_H
