#include "collectionadapter.h"

#include <QJsonValue>
#include <QVariant>

namespace Stash {

// ========== CollectionAdapter ==========

CollectionSchema CollectionAdapter::schema() const
{
    CollectionSchema schema(collectionName());
    schema.priority = priority();
    schema.incrementalPull = supportsIncrementalPull();
    return schema;
}

QString CollectionAdapter::recordName(const QJsonObject &record) const
{
    return QString("%1 %2").arg(displayName(), Records::idOf(record));
}

// ========== FieldMappedAdapter ==========

FieldMappedAdapter::FieldMappedAdapter(const QString &collection,
                                       const QString &table,
                                       const QList<FieldMapping> &fields,
                                       const QString &wireTimestampColumn,
                                       const QString &ownerColumn,
                                       const QStringList &nullColumns)
    : m_collection(collection)
    , m_table(table)
    , m_fields(fields)
    , m_wireTimestampColumn(wireTimestampColumn)
    , m_ownerColumn(ownerColumn)
    , m_nullColumns(nullColumns)
{
}

QJsonObject FieldMappedAdapter::toWire(const QJsonObject &record, const Identity &identity) const
{
    QJsonObject row;
    row.insert(Records::IdField, record.value(Records::IdField));

    for (const FieldMapping &mapping : m_fields) {
        if (record.contains(mapping.local)) {
            row.insert(mapping.wire, record.value(mapping.local));
        }
    }

    if (!m_ownerColumn.isEmpty()) {
        row.insert(m_ownerColumn, identity.userId);
    }
    for (const QString &column : m_nullColumns) {
        row.insert(column, QJsonValue(QJsonValue::Null));
    }
    return row;
}

QJsonObject FieldMappedAdapter::fromWire(const QJsonObject &row) const
{
    QJsonObject record;
    record.insert(Records::IdField, row.value(Records::IdField).toVariant().toString());

    for (const FieldMapping &mapping : m_fields) {
        if (row.contains(mapping.wire)) {
            record.insert(mapping.local, row.value(mapping.wire));
        }
    }

    record.insert(Records::SyncedField, true);
    return record;
}

PullQuery FieldMappedAdapter::pullQuery(const Identity &identity, const QDateTime &since) const
{
    PullQuery query;
    query.ownerField = m_ownerColumn;
    query.ownerId = identity.userId;
    query.timestampField = m_wireTimestampColumn;
    query.limit = pullLimit();
    if (supportsIncrementalPull()) {
        query.updatedSince = since;
    }
    return query;
}

} // namespace Stash
