#ifndef LOCALSTORE_H
#define LOCALSTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMap>
#include <QJsonObject>

#include "storageengine.h"
#include "fallbackstore.h"
#include "../sync/collectionschema.h"

namespace Stash {

/**
 * @brief Durable collections of JSON records with a synced flag
 *
 * LocalStore owns a primary StorageEngine (SQLite in production) and a
 * FallbackStore. Every primary call is inspected; when it reports
 * StorageUnavailable the mutation goes to the fallback instead and the
 * store is flagged as degraded. Reads overlay fallback records on top of
 * primary ones so a caller always sees its latest write.
 *
 * Calls are synchronous from the caller's point of view.
 */
class LocalStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @param primary Primary engine, ownership is taken
     * @param fallbackPath INI file used for the fallback store
     * @param databaseName Logical database name, prefixes fallback keys
     */
    LocalStore(StorageEngine *primary,
               const QString &fallbackPath,
               const QString &databaseName,
               QObject *parent = nullptr);
    ~LocalStore() override;

    /**
     * @brief Open the primary engine
     * @return false when the primary engine is unavailable; the store
     *         remains usable through the fallback
     */
    bool open();

    void close();

    QString databaseName() const { return m_databaseName; }

    // ========== Schemas ==========

    /**
     * @brief Register the schema records of a collection are validated against
     */
    void registerSchema(const CollectionSchema &schema);
    bool hasSchema(const QString &collection) const;
    CollectionSchema schemaFor(const QString &collection) const;

    // ========== Record Operations ==========

    /**
     * @brief Load one record
     * @return Empty object when absent
     */
    QJsonObject get(const QString &collection, const QString &id);

    QList<QJsonObject> getAll(const QString &collection);

    /**
     * @brief Records with synced == false
     *
     * Filtered by the engine; fallback copies written while degraded take
     * precedence over the primary's.
     */
    QList<QJsonObject> getUnsynced(const QString &collection);

    /**
     * @brief Insert or replace one record
     *
     * The record must carry a non-empty string "id". A missing "synced"
     * flag is stored as false.
     */
    bool put(const QString &collection, const QJsonObject &record);

    /**
     * @brief Insert or replace many records in one transaction
     *
     * All-or-nothing on the primary engine. If any record is invalid nothing
     * is written. An empty list is a successful no-op.
     */
    bool putBulk(const QString &collection, const QList<QJsonObject> &records);

    bool remove(const QString &collection, const QString &id);

    bool clear(const QString &collection);

    // ========== Degraded Mode ==========

    /**
     * @brief Whether the fallback store currently holds writes the primary lacks
     */
    bool isDegraded() const { return m_degraded; }

    /**
     * @brief Move fallback writes and deletions back into the primary engine
     * @return Number of records moved, or -1 if the primary is still unavailable
     */
    int reconcileFallback();

    QString lastError() const { return m_lastError; }

    FallbackStore *fallback() { return &m_fallback; }

signals:
    /**
     * @brief Emitted each time an operation is served by the fallback store
     */
    void storageDegraded(const QString &reason);

    void errorOccurred(const QString &error);

private:
    bool normalize(const QString &collection, QJsonObject &record);
    void markDegraded(const QString &operation, const QString &collection, const QString &reason);
    QList<QJsonObject> overlay(const QString &collection, const QList<QJsonObject> &primary);

    StorageEngine *m_primary;
    FallbackStore m_fallback;
    QString m_databaseName;
    QMap<QString, CollectionSchema> m_schemas;
    bool m_degraded = false;
    QString m_lastError;
};

} // namespace Stash

#endif // LOCALSTORE_H
