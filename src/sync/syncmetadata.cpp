#include "syncmetadata.h"
#include "collectionschema.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QDebug>

namespace Stash {

SyncMetadata::SyncMetadata(const QString &filePath, QObject *parent)
    : QObject(parent)
    , m_filePath(filePath)
{
    load();
}

SyncMetadata::~SyncMetadata() = default;

// ========== Overall ==========

void SyncMetadata::setLastSyncTime(const QDateTime &time)
{
    m_lastSyncTime = time;
    save();
    emit metadataChanged();
}

// ========== Per Collection ==========

QDateTime SyncMetadata::lastSyncTime(const QString &collection) const
{
    return m_collections.value(collection).lastSyncTime;
}

void SyncMetadata::setLastSyncTime(const QString &collection, const QDateTime &time)
{
    CollectionSyncInfo &info = m_collections[collection];
    info.lastSyncTime = time;
    info.lastError.clear();
    save();
    emit metadataChanged();
}

QDateTime SyncMetadata::pullCursor(const QString &collection) const
{
    return m_collections.value(collection).pullCursor;
}

void SyncMetadata::advancePullCursor(const QString &collection, const QDateTime &cursor)
{
    if (!cursor.isValid()) return;

    CollectionSyncInfo &info = m_collections[collection];
    if (Records::compareTimestamps(cursor, info.pullCursor) <= 0) {
        return;
    }

    info.pullCursor = cursor;
    save();
    emit metadataChanged();
}

void SyncMetadata::resetPullCursor(const QString &collection)
{
    if (!m_collections.contains(collection)) return;

    m_collections[collection].pullCursor = QDateTime();
    save();
    emit metadataChanged();
}

void SyncMetadata::setLastError(const QString &collection, const QString &error)
{
    m_collections[collection].lastError = error;
    save();
    emit metadataChanged();
}

void SyncMetadata::clear()
{
    m_lastSyncTime = QDateTime();
    m_collections.clear();
    save();
    emit metadataChanged();
}

// ========== Persistence ==========

bool SyncMetadata::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        // No previous state - this is fine for first sync
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open sync metadata: %1").arg(m_filePath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse sync metadata: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    m_lastSyncTime = Records::parseTimestamp(root["lastSyncTime"]);

    m_collections.clear();
    const QJsonObject collections = root["collections"].toObject();
    for (auto it = collections.begin(); it != collections.end(); ++it) {
        const QJsonObject obj = it.value().toObject();
        CollectionSyncInfo info;
        info.lastSyncTime = Records::parseTimestamp(obj["lastSyncTime"]);
        info.pullCursor = Records::parseTimestamp(obj["pullCursor"]);
        info.lastError = obj["lastError"].toString();
        m_collections.insert(it.key(), info);
    }

    qDebug() << "[SyncMetadata] Loaded metadata for" << m_collections.size() << "collections";
    return true;
}

bool SyncMetadata::save()
{
    QDir dir = QFileInfo(m_filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(dir.path()));
        return false;
    }

    QJsonObject root;
    root["version"] = 1;
    root["lastSyncTime"] = Records::formatTimestamp(m_lastSyncTime);

    QJsonObject collections;
    for (auto it = m_collections.constBegin(); it != m_collections.constEnd(); ++it) {
        QJsonObject obj;
        obj["lastSyncTime"] = Records::formatTimestamp(it.value().lastSyncTime);
        obj["pullCursor"] = Records::formatTimestamp(it.value().pullCursor);
        if (!it.value().lastError.isEmpty()) {
            obj["lastError"] = it.value().lastError;
        }
        collections[it.key()] = obj;
    }
    root["collections"] = collections;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save sync metadata: %1").arg(m_filePath));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit sync metadata: %1").arg(m_filePath));
        return false;
    }
    return true;
}

} // namespace Stash
