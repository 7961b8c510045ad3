#include "fallbackstore.h"
#include "../sync/collectionschema.h"

#include <QJsonArray>
#include <algorithm>
#include <QJsonDocument>
#include <QDebug>

namespace Stash {

FallbackStore::FallbackStore(const QString &filePath, const QString &databaseName)
    : m_databaseName(databaseName)
    , m_settings(filePath, QSettings::IniFormat)
{
}

QString FallbackStore::keyFor(const QString &collection) const
{
    return QString("%1_%2").arg(m_databaseName, collection);
}

QList<QJsonObject> FallbackStore::readAll(const QString &collection) const
{
    QList<QJsonObject> records;

    const QString raw = m_settings.value(keyFor(collection)).toString();
    if (raw.isEmpty()) {
        return records;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(raw.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "[FallbackStore] Ignoring corrupt value for" << keyFor(collection);
        return records;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        if (value.isObject()) {
            records.append(value.toObject());
        }
    }
    return records;
}

QJsonObject FallbackStore::read(const QString &collection, const QString &id) const
{
    const QList<QJsonObject> records = readAll(collection);
    for (const QJsonObject &record : records) {
        if (Records::idOf(record) == id) {
            return record;
        }
    }
    return QJsonObject();
}

bool FallbackStore::write(const QString &collection, const QJsonObject &record)
{
    QList<QJsonObject> records = readAll(collection);
    const QString id = Records::idOf(record);

    bool replaced = false;
    for (QJsonObject &existing : records) {
        if (Records::idOf(existing) == id) {
            existing = record;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        records.append(record);
    }

    return store(collection, records);
}

bool FallbackStore::remove(const QString &collection, const QString &id)
{
    return removeIds(collection, QStringList{id});
}

bool FallbackStore::removeIds(const QString &collection, const QStringList &ids)
{
    if (ids.isEmpty() || !m_settings.contains(keyFor(collection))) {
        return true;
    }

    QList<QJsonObject> records = readAll(collection);
    const int before = records.size();
    records.erase(std::remove_if(records.begin(), records.end(),
                                 [&ids](const QJsonObject &record) {
                                     return ids.contains(Records::idOf(record));
                                 }),
                  records.end());

    if (records.size() == before) {
        return true;
    }
    return store(collection, records);
}

bool FallbackStore::clear(const QString &collection)
{
    m_settings.remove(keyFor(collection));
    m_settings.remove(QString("tombstones/%1").arg(keyFor(collection)));
    m_settings.sync();
    return m_settings.status() == QSettings::NoError;
}

// ========== Tombstones ==========

bool FallbackStore::addTombstone(const QString &collection, const QString &id)
{
    QStringList ids = tombstones(collection);
    if (ids.contains(id)) {
        return true;
    }
    ids << id;

    m_settings.setValue(QString("tombstones/%1").arg(keyFor(collection)), ids);
    m_settings.sync();
    return m_settings.status() == QSettings::NoError;
}

QStringList FallbackStore::tombstones(const QString &collection) const
{
    return m_settings.value(QString("tombstones/%1").arg(keyFor(collection))).toStringList();
}

bool FallbackStore::clearTombstones(const QString &collection, const QStringList &ids)
{
    QStringList remaining = tombstones(collection);
    for (const QString &id : ids) {
        remaining.removeAll(id);
    }

    const QString key = QString("tombstones/%1").arg(keyFor(collection));
    if (remaining.isEmpty()) {
        m_settings.remove(key);
    } else {
        m_settings.setValue(key, remaining);
    }
    m_settings.sync();
    return m_settings.status() == QSettings::NoError;
}

QStringList FallbackStore::collections() const
{
    QStringList result;
    const QString prefix = m_databaseName + "_";

    const QStringList keys = m_settings.childKeys();
    for (const QString &key : keys) {
        if (!key.startsWith(prefix)) continue;
        const QString collection = key.mid(prefix.size());
        if (!readAll(collection).isEmpty()) {
            result << collection;
        }
    }

    m_settings.beginGroup("tombstones");
    const QStringList deleted = m_settings.childKeys();
    m_settings.endGroup();
    for (const QString &key : deleted) {
        if (!key.startsWith(prefix)) continue;
        const QString collection = key.mid(prefix.size());
        if (!result.contains(collection)) {
            result << collection;
        }
    }

    return result;
}

bool FallbackStore::store(const QString &collection, const QList<QJsonObject> &records)
{
    if (records.isEmpty()) {
        m_settings.remove(keyFor(collection));
    } else {
        QJsonArray array;
        for (const QJsonObject &record : records) {
            array.append(record);
        }
        m_settings.setValue(keyFor(collection),
                            QString::fromUtf8(QJsonDocument(array).toJson(QJsonDocument::Compact)));
    }

    m_settings.sync();
    if (m_settings.status() != QSettings::NoError) {
        qWarning() << "[FallbackStore] Failed to write" << m_settings.fileName();
        return false;
    }
    return true;
}

} // namespace Stash
