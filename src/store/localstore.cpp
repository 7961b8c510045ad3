#include "localstore.h"

#include <QSet>
#include <QDebug>

namespace Stash {

LocalStore::LocalStore(StorageEngine *primary,
                       const QString &fallbackPath,
                       const QString &databaseName,
                       QObject *parent)
    : QObject(parent)
    , m_primary(primary)
    , m_fallback(fallbackPath, databaseName)
    , m_databaseName(databaseName)
{
    // Leftovers from a previous degraded session
    m_degraded = !m_fallback.isEmpty();
}

LocalStore::~LocalStore()
{
    if (m_primary) {
        m_primary->close();
        delete m_primary;
    }
}

bool LocalStore::open()
{
    StorageStatus status = m_primary->open();
    if (!status.isOk()) {
        m_lastError = status.error();
        markDegraded("open", QString(), status.error());
        return false;
    }

    if (m_degraded) {
        reconcileFallback();
    }
    return true;
}

void LocalStore::close()
{
    m_primary->close();
}

// ========== Schemas ==========

void LocalStore::registerSchema(const CollectionSchema &schema)
{
    m_schemas[schema.name] = schema;
}

bool LocalStore::hasSchema(const QString &collection) const
{
    return m_schemas.contains(collection);
}

CollectionSchema LocalStore::schemaFor(const QString &collection) const
{
    return m_schemas.value(collection, CollectionSchema(collection));
}

// ========== Record Operations ==========

QJsonObject LocalStore::get(const QString &collection, const QString &id)
{
    QJsonObject fromFallback = m_fallback.read(collection, id);
    if (!fromFallback.isEmpty()) {
        return fromFallback;
    }
    if (m_fallback.tombstones(collection).contains(id)) {
        return QJsonObject();
    }

    StorageResult<QJsonObject> result = m_primary->get(collection, id);
    if (!result.isOk()) {
        markDegraded("get", collection, result.error());
        return QJsonObject();
    }
    return result.value();
}

QList<QJsonObject> LocalStore::getAll(const QString &collection)
{
    StorageResult<QList<QJsonObject>> result = m_primary->getAll(collection);
    if (!result.isOk()) {
        markDegraded("getAll", collection, result.error());
        return m_fallback.readAll(collection);
    }
    return overlay(collection, result.value());
}

QList<QJsonObject> LocalStore::getUnsynced(const QString &collection)
{
    QList<QJsonObject> candidates;
    StorageResult<QList<QJsonObject>> result = m_primary->getUnsynced(collection);
    if (result.isOk()) {
        candidates = overlay(collection, result.value());
    } else {
        markDegraded("getUnsynced", collection, result.error());
        candidates = m_fallback.readAll(collection);
    }

    // A fallback copy may have been acknowledged since the primary saw it
    QList<QJsonObject> unsynced;
    for (const QJsonObject &record : candidates) {
        if (!Records::isSynced(record)) {
            unsynced.append(record);
        }
    }
    return unsynced;
}

bool LocalStore::put(const QString &collection, const QJsonObject &record)
{
    QJsonObject normalized = record;
    if (!normalize(collection, normalized)) {
        return false;
    }

    const QString id = Records::idOf(normalized);
    StorageStatus status = m_primary->put(collection, normalized);
    if (status.isOk()) {
        if (m_degraded) {
            m_fallback.remove(collection, id);
            m_fallback.clearTombstones(collection, {id});
        }
        return true;
    }

    markDegraded("put", collection, status.error());
    if (!m_fallback.write(collection, normalized)) {
        m_lastError = QString("Fallback write failed for %1/%2").arg(collection, id);
        emit errorOccurred(m_lastError);
        return false;
    }
    m_fallback.clearTombstones(collection, {id});
    return true;
}

bool LocalStore::putBulk(const QString &collection, const QList<QJsonObject> &records)
{
    if (records.isEmpty()) {
        return true;
    }

    QList<QJsonObject> normalized;
    normalized.reserve(records.size());
    QStringList ids;
    for (const QJsonObject &record : records) {
        QJsonObject copy = record;
        if (!normalize(collection, copy)) {
            return false;
        }
        ids << Records::idOf(copy);
        normalized.append(copy);
    }

    StorageStatus status = m_primary->putBulk(collection, normalized);
    if (status.isOk()) {
        if (m_degraded) {
            m_fallback.removeIds(collection, ids);
            m_fallback.clearTombstones(collection, ids);
        }
        return true;
    }

    markDegraded("putBulk", collection, status.error());

    // Per-record in the fallback: no cross-record atomicity there
    bool allWritten = true;
    for (const QJsonObject &record : normalized) {
        if (!m_fallback.write(collection, record)) {
            allWritten = false;
        }
    }
    m_fallback.clearTombstones(collection, ids);

    if (!allWritten) {
        m_lastError = QString("Fallback bulk write incomplete for %1").arg(collection);
        emit errorOccurred(m_lastError);
    }
    return allWritten;
}

bool LocalStore::remove(const QString &collection, const QString &id)
{
    StorageStatus status = m_primary->remove(collection, id);
    if (status.isOk()) {
        if (m_degraded) {
            m_fallback.remove(collection, id);
            m_fallback.clearTombstones(collection, {id});
        }
        return true;
    }

    markDegraded("remove", collection, status.error());
    bool removed = m_fallback.remove(collection, id);
    bool marked = m_fallback.addTombstone(collection, id);
    if (!removed || !marked) {
        m_lastError = QString("Fallback delete failed for %1/%2").arg(collection, id);
        emit errorOccurred(m_lastError);
        return false;
    }
    return true;
}

bool LocalStore::clear(const QString &collection)
{
    StorageStatus status = m_primary->clear(collection);
    if (status.isOk()) {
        return m_fallback.clear(collection);
    }

    markDegraded("clear", collection, status.error());

    // Tombstone every primary record we can still see
    const QList<QJsonObject> visible = getAll(collection);
    bool ok = m_fallback.clear(collection);
    for (const QJsonObject &record : visible) {
        ok = m_fallback.addTombstone(collection, Records::idOf(record)) && ok;
    }
    return ok;
}

// ========== Degraded Mode ==========

int LocalStore::reconcileFallback()
{
    const QStringList collections = m_fallback.collections();
    if (collections.isEmpty()) {
        m_degraded = false;
        return 0;
    }

    if (!m_primary->isOpen() && !m_primary->open().isOk()) {
        return -1;
    }

    int moved = 0;
    bool complete = true;

    for (const QString &collection : collections) {
        const QList<QJsonObject> records = m_fallback.readAll(collection);
        if (!records.isEmpty()) {
            StorageStatus status = m_primary->putBulk(collection, records);
            if (!status.isOk()) {
                qWarning() << "[LocalStore] Reconcile of" << collection << "failed:" << status.error();
                complete = false;
                continue;
            }
            QStringList ids;
            for (const QJsonObject &record : records) {
                ids << Records::idOf(record);
            }
            m_fallback.removeIds(collection, ids);
            moved += records.size();
        }

        const QStringList deleted = m_fallback.tombstones(collection);
        QStringList applied;
        for (const QString &id : deleted) {
            if (m_primary->remove(collection, id).isOk()) {
                applied << id;
            } else {
                complete = false;
            }
        }
        m_fallback.clearTombstones(collection, applied);
    }

    if (complete) {
        m_degraded = false;
        qInfo() << "[LocalStore] Reconciled" << moved << "fallback records into primary storage";
    }
    return moved;
}

// ========== Helpers ==========

bool LocalStore::normalize(const QString &collection, QJsonObject &record)
{
    if (!record.contains(Records::SyncedField)) {
        record.insert(Records::SyncedField, false);
    }

    QString error;
    if (!schemaFor(collection).validate(record, &error)) {
        m_lastError = error;
        qWarning() << "[LocalStore] Rejected record:" << error;
        emit errorOccurred(error);
        return false;
    }
    return true;
}

void LocalStore::markDegraded(const QString &operation, const QString &collection, const QString &reason)
{
    m_degraded = true;
    m_lastError = reason;

    QString message = collection.isEmpty()
        ? QString("%1: primary storage unavailable (%2)").arg(operation, reason)
        : QString("%1 %2: primary storage unavailable (%3)").arg(operation, collection, reason);
    qWarning() << "[LocalStore] Degraded -" << message;
    emit storageDegraded(message);
}

QList<QJsonObject> LocalStore::overlay(const QString &collection, const QList<QJsonObject> &primary)
{
    if (!m_degraded) {
        return primary;
    }

    const QList<QJsonObject> fallbackRecords = m_fallback.readAll(collection);
    const QStringList deletedIds = m_fallback.tombstones(collection);
    if (fallbackRecords.isEmpty() && deletedIds.isEmpty()) {
        return primary;
    }

    QMap<QString, QJsonObject> fallbackById;
    for (const QJsonObject &record : fallbackRecords) {
        fallbackById.insert(Records::idOf(record), record);
    }

    QList<QJsonObject> merged;
    QSet<QString> seen;
    for (const QJsonObject &record : primary) {
        const QString id = Records::idOf(record);
        if (deletedIds.contains(id)) continue;
        seen.insert(id);
        merged.append(fallbackById.value(id, record));
    }
    for (const QJsonObject &record : fallbackRecords) {
        if (!seen.contains(Records::idOf(record))) {
            merged.append(record);
        }
    }
    return merged;
}

} // namespace Stash
