#include "sqlitestorageengine.h"
#include "../sync/collectionschema.h"

#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QDebug>

#include <sqlite3.h>

namespace Stash {

namespace {

const char *const kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS records (
        collection TEXT NOT NULL,
        id TEXT NOT NULL,
        data TEXT NOT NULL,
        synced INTEGER NOT NULL DEFAULT 0,
        PRIMARY KEY (collection, id)
    );
    CREATE INDEX IF NOT EXISTS idx_records_unsynced ON records(collection, synced);
)";

const char *const kUpsertSql = R"(
    INSERT INTO records (collection, id, data, synced)
    VALUES (?, ?, ?, ?)
    ON CONFLICT(collection, id) DO UPDATE SET
        data = excluded.data,
        synced = excluded.synced
)";

QByteArray toUtf8(const QString &text)
{
    return text.toUtf8();
}

QJsonObject parseRow(sqlite3_stmt *stmt)
{
    const char *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
    const int size = sqlite3_column_bytes(stmt, 0);
    if (!text) {
        return QJsonObject();
    }
    return QJsonDocument::fromJson(QByteArray(text, size)).object();
}

} // namespace

SqliteStorageEngine::SqliteStorageEngine(const QString &databasePath)
    : m_databasePath(databasePath)
{
}

SqliteStorageEngine::~SqliteStorageEngine()
{
    close();
}

StorageStatus SqliteStorageEngine::open()
{
    if (m_db) {
        return storageOk();
    }

    QFileInfo info(m_databasePath);
    QDir dir = info.absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return StorageStatus::unavailable(
            QString("Cannot create database directory: %1").arg(dir.path()));
    }

    const QByteArray path = toUtf8(m_databasePath);
    int rc = sqlite3_open_v2(path.constData(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        QString error = QString("Failed to open database %1: %2")
            .arg(m_databasePath, m_db ? QString::fromUtf8(sqlite3_errmsg(m_db))
                                      : QString::fromUtf8(sqlite3_errstr(rc)));
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        qWarning() << "[SqliteStorageEngine]" << error;
        return StorageStatus::unavailable(error);
    }

    sqlite3_busy_timeout(m_db, 5000);
    StorageStatus pragma = exec("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;");
    if (!pragma.isOk()) {
        qWarning() << "[SqliteStorageEngine] Could not enable WAL:" << pragma.error();
    }

    StorageStatus schema = exec(kSchemaSql);
    if (!schema.isOk()) {
        qWarning() << "[SqliteStorageEngine] Schema creation failed:" << schema.error();
        close();
        return schema;
    }

    qDebug() << "[SqliteStorageEngine] Opened" << m_databasePath;
    return storageOk();
}

void SqliteStorageEngine::close()
{
    if (!m_db) return;

    sqlite3_close(m_db);
    m_db = nullptr;
    qDebug() << "[SqliteStorageEngine] Closed" << m_databasePath;
}

// ========== Record Operations ==========

StorageResult<QJsonObject> SqliteStorageEngine::get(const QString &collection, const QString &id)
{
    if (!m_db) {
        return StorageResult<QJsonObject>::unavailable("Database is not open");
    }

    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "SELECT data FROM records WHERE collection = ? AND id = ?",
                                -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return StorageResult<QJsonObject>::unavailable(lastError());
    }

    const QByteArray col = toUtf8(collection);
    const QByteArray key = toUtf8(id);
    sqlite3_bind_text(stmt, 1, col.constData(), col.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.constData(), key.size(), SQLITE_TRANSIENT);

    QJsonObject record;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        record = parseRow(stmt);
    } else if (rc != SQLITE_DONE) {
        QString error = lastError();
        sqlite3_finalize(stmt);
        return StorageResult<QJsonObject>::unavailable(error);
    }

    sqlite3_finalize(stmt);
    return StorageResult<QJsonObject>::ok(record);
}

StorageResult<QList<QJsonObject>> SqliteStorageEngine::getAll(const QString &collection)
{
    return query("SELECT data FROM records WHERE collection = ? ORDER BY rowid", collection);
}

StorageResult<QList<QJsonObject>> SqliteStorageEngine::getUnsynced(const QString &collection)
{
    return query("SELECT data FROM records WHERE collection = ? AND synced = 0 ORDER BY rowid",
                 collection);
}

StorageStatus SqliteStorageEngine::put(const QString &collection, const QJsonObject &record)
{
    if (!m_db) {
        return StorageStatus::unavailable("Database is not open");
    }

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        return StorageStatus::unavailable(lastError());
    }

    StorageStatus status = upsert(stmt, collection, record);
    sqlite3_finalize(stmt);
    return status;
}

StorageStatus SqliteStorageEngine::putBulk(const QString &collection, const QList<QJsonObject> &records)
{
    if (!m_db) {
        return StorageStatus::unavailable("Database is not open");
    }
    if (records.isEmpty()) {
        return storageOk();
    }

    StorageStatus begin = exec("BEGIN IMMEDIATE;");
    if (!begin.isOk()) {
        return begin;
    }

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, kUpsertSql, -1, &stmt, nullptr) != SQLITE_OK) {
        QString error = lastError();
        exec("ROLLBACK;");
        return StorageStatus::unavailable(error);
    }

    for (const QJsonObject &record : records) {
        StorageStatus status = upsert(stmt, collection, record);
        if (!status.isOk()) {
            sqlite3_finalize(stmt);
            exec("ROLLBACK;");
            qWarning() << "[SqliteStorageEngine] putBulk rolled back in" << collection
                       << ":" << status.error();
            return status;
        }
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
    }

    sqlite3_finalize(stmt);

    StorageStatus commit = exec("COMMIT;");
    if (!commit.isOk()) {
        exec("ROLLBACK;");
        return commit;
    }

    return storageOk();
}

StorageStatus SqliteStorageEngine::remove(const QString &collection, const QString &id)
{
    if (!m_db) {
        return StorageStatus::unavailable("Database is not open");
    }

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM records WHERE collection = ? AND id = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return StorageStatus::unavailable(lastError());
    }

    const QByteArray col = toUtf8(collection);
    const QByteArray key = toUtf8(id);
    sqlite3_bind_text(stmt, 1, col.constData(), col.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.constData(), key.size(), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    QString error = rc == SQLITE_DONE ? QString() : lastError();
    sqlite3_finalize(stmt);

    return error.isEmpty() ? storageOk() : StorageStatus::unavailable(error);
}

StorageStatus SqliteStorageEngine::clear(const QString &collection)
{
    if (!m_db) {
        return StorageStatus::unavailable("Database is not open");
    }

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, "DELETE FROM records WHERE collection = ?",
                           -1, &stmt, nullptr) != SQLITE_OK) {
        return StorageStatus::unavailable(lastError());
    }

    const QByteArray col = toUtf8(collection);
    sqlite3_bind_text(stmt, 1, col.constData(), col.size(), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    QString error = rc == SQLITE_DONE ? QString() : lastError();
    sqlite3_finalize(stmt);

    return error.isEmpty() ? storageOk() : StorageStatus::unavailable(error);
}

// ========== Helpers ==========

StorageStatus SqliteStorageEngine::exec(const char *sql)
{
    char *errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        QString error = QString::fromUtf8(errMsg ? errMsg : sqlite3_errstr(rc));
        if (errMsg) sqlite3_free(errMsg);
        return StorageStatus::unavailable(error);
    }
    return storageOk();
}

StorageStatus SqliteStorageEngine::upsert(sqlite3_stmt *stmt, const QString &collection,
                                          const QJsonObject &record)
{
    const QByteArray col = toUtf8(collection);
    const QByteArray key = toUtf8(Records::idOf(record));
    const QByteArray data = QJsonDocument(record).toJson(QJsonDocument::Compact);

    sqlite3_bind_text(stmt, 1, col.constData(), col.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, key.constData(), key.size(), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, data.constData(), data.size(), SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 4, Records::isSynced(record) ? 1 : 0);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return StorageStatus::unavailable(
            QString("Write of %1/%2 failed: %3").arg(collection, Records::idOf(record), lastError()));
    }
    return storageOk();
}

StorageResult<QList<QJsonObject>> SqliteStorageEngine::query(const char *sql, const QString &collection)
{
    if (!m_db) {
        return StorageResult<QList<QJsonObject>>::unavailable("Database is not open");
    }

    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(m_db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return StorageResult<QList<QJsonObject>>::unavailable(lastError());
    }

    const QByteArray col = toUtf8(collection);
    sqlite3_bind_text(stmt, 1, col.constData(), col.size(), SQLITE_TRANSIENT);

    QList<QJsonObject> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        QJsonObject record = parseRow(stmt);
        if (!record.isEmpty()) {
            records.append(record);
        }
    }

    if (rc != SQLITE_DONE) {
        QString error = lastError();
        sqlite3_finalize(stmt);
        return StorageResult<QList<QJsonObject>>::unavailable(error);
    }

    sqlite3_finalize(stmt);
    return StorageResult<QList<QJsonObject>>::ok(records);
}

QString SqliteStorageEngine::lastError() const
{
    return m_db ? QString::fromUtf8(sqlite3_errmsg(m_db)) : QString("Database is not open");
}

} // namespace Stash
