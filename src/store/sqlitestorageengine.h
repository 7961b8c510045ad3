#ifndef SQLITESTORAGEENGINE_H
#define SQLITESTORAGEENGINE_H

#include "storageengine.h"

struct sqlite3;
struct sqlite3_stmt;

namespace Stash {

/**
 * @brief SQLite-backed primary record store
 *
 * All collections share one table:
 *
 *   records(collection TEXT, id TEXT, data TEXT, synced INTEGER,
 *           PRIMARY KEY (collection, id))
 *
 * The database runs in WAL mode. putBulk() wraps its writes in
 * BEGIN IMMEDIATE / COMMIT and rolls back on the first failure.
 */
class SqliteStorageEngine : public StorageEngine
{
public:
    explicit SqliteStorageEngine(const QString &databasePath);
    ~SqliteStorageEngine() override;

    SqliteStorageEngine(const SqliteStorageEngine &) = delete;
    SqliteStorageEngine &operator=(const SqliteStorageEngine &) = delete;

    QString engineId() const override { return "sqlite"; }
    StorageStatus open() override;
    bool isOpen() const override { return m_db != nullptr; }
    void close() override;

    StorageResult<QJsonObject> get(const QString &collection, const QString &id) override;
    StorageResult<QList<QJsonObject>> getAll(const QString &collection) override;
    StorageResult<QList<QJsonObject>> getUnsynced(const QString &collection) override;
    StorageStatus put(const QString &collection, const QJsonObject &record) override;
    StorageStatus putBulk(const QString &collection, const QList<QJsonObject> &records) override;
    StorageStatus remove(const QString &collection, const QString &id) override;
    StorageStatus clear(const QString &collection) override;

    QString databasePath() const { return m_databasePath; }

private:
    StorageStatus exec(const char *sql);
    StorageStatus upsert(sqlite3_stmt *stmt, const QString &collection, const QJsonObject &record);
    StorageResult<QList<QJsonObject>> query(const char *sql, const QString &collection);
    QString lastError() const;

    QString m_databasePath;
    sqlite3 *m_db = nullptr;
};

} // namespace Stash

#endif // SQLITESTORAGEENGINE_H
