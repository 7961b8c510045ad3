#ifndef STORAGEENGINE_H
#define STORAGEENGINE_H

#include <QString>
#include <QList>
#include <QJsonObject>
#include "storageresult.h"

namespace Stash {

/**
 * @brief Abstract interface for the primary durable record store
 *
 * Records are JSON objects partitioned by collection and keyed by their
 * "id" field. Every call reports StorageUnavailable instead of throwing.
 */
class StorageEngine
{
public:
    virtual ~StorageEngine() = default;

    // ========== Engine Identity ==========

    /**
     * @brief Unique identifier for this engine type, e.g. "sqlite"
     */
    virtual QString engineId() const = 0;

    /**
     * @brief Open (or create) the underlying storage
     */
    virtual StorageStatus open() = 0;

    virtual bool isOpen() const = 0;

    virtual void close() = 0;

    // ========== Record Operations ==========

    /**
     * @brief Load one record
     * @return Empty object when the record does not exist
     */
    virtual StorageResult<QJsonObject> get(const QString &collection, const QString &id) = 0;

    virtual StorageResult<QList<QJsonObject>> getAll(const QString &collection) = 0;

    /**
     * @brief Records whose synced flag is false
     */
    virtual StorageResult<QList<QJsonObject>> getUnsynced(const QString &collection) = 0;

    /**
     * @brief Insert or replace one record
     */
    virtual StorageStatus put(const QString &collection, const QJsonObject &record) = 0;

    /**
     * @brief Insert or replace many records in one transaction
     *
     * All-or-nothing: on failure no record of the batch is visible and the
     * rest of the collection is untouched.
     */
    virtual StorageStatus putBulk(const QString &collection, const QList<QJsonObject> &records) = 0;

    virtual StorageStatus remove(const QString &collection, const QString &id) = 0;

    virtual StorageStatus clear(const QString &collection) = 0;
};

} // namespace Stash

#endif // STORAGEENGINE_H
