#ifndef COLLECTIONADAPTER_H
#define COLLECTIONADAPTER_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QDateTime>
#include <QJsonObject>

#include "collectionschema.h"
#include "remotebackend.h"
#include "environment.h"

namespace Stash {

/**
 * @brief Maps one local collection to its remote table
 *
 * The sync engine is collection-agnostic; everything it needs to know
 * about a collection (name, table, priority, record shape on both sides)
 * comes from its adapter.
 *
 * To add a collection:
 * 1. Subclass CollectionAdapter (or FieldMappedAdapter)
 * 2. Register an instance with SyncEngine::registerAdapter()
 */
class CollectionAdapter
{
public:
    virtual ~CollectionAdapter() = default;

    // ========== Identity ==========

    /**
     * @brief Local collection name, e.g. "drawings"
     */
    virtual QString collectionName() const = 0;

    /**
     * @brief Remote table name, e.g. "drawings"
     */
    virtual QString remoteTable() const = 0;

    virtual QString displayName() const { return collectionName(); }

    /**
     * @brief Push and retry priority; higher runs first
     */
    virtual int priority() const { return 1; }

    /**
     * @brief Whether pulls can be restricted to rows updated since a cursor
     */
    virtual bool supportsIncrementalPull() const { return true; }

    /**
     * @brief Schema the local store and conflict resolver use for this collection
     */
    virtual CollectionSchema schema() const;

    // ========== Mapping ==========

    /**
     * @brief Local record to wire row, stamped with the owner identity
     */
    virtual QJsonObject toWire(const QJsonObject &record, const Identity &identity) const = 0;

    /**
     * @brief Wire row to local record, flagged synced
     */
    virtual QJsonObject fromWire(const QJsonObject &row) const = 0;

    /**
     * @brief Query for the next pull
     * @param since Cursor from the previous pull, invalid for a full pull
     */
    virtual PullQuery pullQuery(const Identity &identity, const QDateTime &since) const = 0;

    /**
     * @brief Human-readable label for a record, shown with conflicts
     */
    virtual QString recordName(const QJsonObject &record) const;
};

/**
 * @brief Local field name paired with its wire column
 */
struct FieldMapping {
    QString local;
    QString wire;
};

/**
 * @brief Adapter driven by a camelCase-to-snake_case field table
 *
 * toWire() copies mapped fields present in the record, always carries the
 * id, stamps the owner column with the user id and sets the declared
 * null columns. Unmapped local fields are not sent.
 */
class FieldMappedAdapter : public CollectionAdapter
{
public:
    QString collectionName() const override { return m_collection; }
    QString remoteTable() const override { return m_table; }

    QJsonObject toWire(const QJsonObject &record, const Identity &identity) const override;
    QJsonObject fromWire(const QJsonObject &row) const override;
    PullQuery pullQuery(const Identity &identity, const QDateTime &since) const override;

    QString ownerColumn() const { return m_ownerColumn; }
    QString wireTimestampColumn() const { return m_wireTimestampColumn; }
    QList<FieldMapping> fields() const { return m_fields; }

protected:
    FieldMappedAdapter(const QString &collection,
                       const QString &table,
                       const QList<FieldMapping> &fields,
                       const QString &wireTimestampColumn,
                       const QString &ownerColumn = QStringLiteral("user_id"),
                       const QStringList &nullColumns = QStringList());

    /**
     * @brief Maximum rows per pull; 0 means all
     */
    virtual int pullLimit() const { return 0; }

private:
    QString m_collection;
    QString m_table;
    QList<FieldMapping> m_fields;
    QString m_wireTimestampColumn;
    QString m_ownerColumn;
    QStringList m_nullColumns;
};

} // namespace Stash

#endif // COLLECTIONADAPTER_H
