#include "conflictresolver.h"
#include "../sync/environment.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonDocument>
#include <QDebug>

#include <algorithm>

namespace Stash {

ConflictResolver::ConflictResolver(const QString &filePath, Clock *clock, QObject *parent)
    : QObject(parent)
    , m_filePath(filePath)
    , m_clock(clock ? clock : SystemClock::instance())
{
    load();
}

ConflictResolver::~ConflictResolver() = default;

void ConflictResolver::registerSchema(const CollectionSchema &schema)
{
    m_schemas[schema.name] = schema;
}

CollectionSchema ConflictResolver::schemaFor(const QString &collection) const
{
    return m_schemas.value(collection, CollectionSchema(collection));
}

// ========== Detection ==========

ConflictGroup ConflictResolver::detectConflicts(const QString &collection,
                                                const QString &recordId,
                                                const QJsonObject &local,
                                                const QJsonObject &remote,
                                                const QString &recordName) const
{
    if (local == remote) {
        return ConflictGroup();
    }

    const CollectionSchema schema = schemaFor(collection);
    const QDateTime localTimestamp = schema.timestampOf(local);
    const QDateTime remoteTimestamp = schema.timestampOf(remote);

    // Remote already supersedes an acknowledged local copy
    if (Records::isSynced(local) && Records::compareTimestamps(remoteTimestamp, localTimestamp) > 0) {
        return ConflictGroup();
    }

    ConflictGroup group;
    group.id = QString("%1-%2-%3").arg(collection, recordId).arg(m_clock->nowMSecs());
    group.collection = collection;
    group.recordId = recordId;
    group.recordName = recordName;
    group.localData = local;
    group.remoteData = remote;
    group.createdAt = m_clock->now();

    QStringList fields = local.keys();
    for (const QString &key : remote.keys()) {
        if (!local.contains(key)) {
            fields << key;
        }
    }
    std::sort(fields.begin(), fields.end());

    for (const QString &field : fields) {
        if (schema.isIgnored(field)) continue;

        const QJsonValue localValue = local.value(field);
        const QJsonValue remoteValue = remote.value(field);
        if (localValue == remoteValue) continue;

        FieldConflict conflict;
        conflict.id = QString("%1-%2").arg(group.id, field);
        conflict.field = field;
        conflict.localValue = localValue;
        conflict.remoteValue = remoteValue;
        conflict.localTimestamp = localTimestamp;
        conflict.remoteTimestamp = remoteTimestamp;
        group.conflicts.append(conflict);
    }

    if (group.conflicts.isEmpty()) {
        return ConflictGroup();
    }
    return group;
}

// ========== Pending Conflicts ==========

QString ConflictResolver::addConflict(const ConflictGroup &group)
{
    if (!group.isValid()) {
        qWarning() << "[ConflictResolver] Ignoring empty conflict group for"
                   << group.collection << group.recordId;
        return QString();
    }

    QString storedId = group.id;
    int existing = indexFor(group.collection, group.recordId);
    if (existing >= 0) {
        // Refresh in place: same id, same creation time, new contents
        ConflictGroup refreshed = group;
        refreshed.id = m_conflicts[existing].id;
        refreshed.createdAt = m_conflicts[existing].createdAt;
        for (FieldConflict &conflict : refreshed.conflicts) {
            conflict.id = QString("%1-%2").arg(refreshed.id, conflict.field);
        }
        m_conflicts[existing] = refreshed;
        storedId = refreshed.id;
        qDebug() << "[ConflictResolver] Refreshed conflict" << storedId;
    } else {
        m_conflicts.append(group);
        qInfo() << "[ConflictResolver] New conflict" << storedId << "on"
                << group.fieldNames().join(", ");
    }

    save();
    emit conflictsChanged(m_conflicts.size());
    return storedId;
}

QList<ConflictGroup> ConflictResolver::getConflictsByStore(const QString &collection) const
{
    QList<ConflictGroup> result;
    for (const ConflictGroup &group : m_conflicts) {
        if (group.collection == collection) {
            result.append(group);
        }
    }
    return result;
}

ConflictGroup ConflictResolver::conflict(const QString &conflictId) const
{
    int index = indexOf(conflictId);
    return index >= 0 ? m_conflicts[index] : ConflictGroup();
}

bool ConflictResolver::hasConflictFor(const QString &collection, const QString &recordId) const
{
    return indexFor(collection, recordId) >= 0;
}

// ========== Resolution ==========

bool ConflictResolver::resolveConflict(const QString &conflictId, ResolutionChoice choice,
                                       ResolvedRecord *resolved)
{
    int index = indexOf(conflictId);
    if (index < 0) {
        emit errorOccurred(QString("Conflict not found: %1").arg(conflictId));
        return false;
    }

    const ConflictGroup group = m_conflicts.takeAt(index);
    if (resolved) {
        resolved->conflictId = group.id;
        resolved->collection = group.collection;
        resolved->recordId = group.recordId;
        resolved->choice = choice;
        resolved->data = resolveConflictData(group, choice);
    }

    save();
    emit conflictsChanged(m_conflicts.size());

    qInfo() << "[ConflictResolver] Resolved" << conflictId << "with"
            << resolutionChoiceToString(choice);
    return true;
}

QList<ResolvedRecord> ConflictResolver::resolveBatch(const QStringList &conflictIds, ResolutionChoice choice)
{
    QList<ResolvedRecord> resolved;
    QStringList missing;

    for (int start = 0; start < conflictIds.size(); start += m_chunkSize) {
        const int end = std::min<int>(start + m_chunkSize, conflictIds.size());
        for (int i = start; i < end; ++i) {
            int index = indexOf(conflictIds[i]);
            if (index < 0) {
                missing << conflictIds[i];
                continue;
            }

            const ConflictGroup group = m_conflicts.takeAt(index);
            ResolvedRecord record;
            record.conflictId = group.id;
            record.collection = group.collection;
            record.recordId = group.recordId;
            record.choice = choice;
            record.data = resolveConflictData(group, choice);
            resolved.append(record);
        }

        if (end < conflictIds.size()) {
            yieldToEventLoop();
        }
    }

    if (!missing.isEmpty()) {
        qWarning() << "[ConflictResolver] Batch resolution skipped unknown conflicts:" << missing;
    }

    if (!resolved.isEmpty()) {
        save();
        emit conflictsChanged(m_conflicts.size());
    }

    qInfo() << "[ConflictResolver] Resolved" << resolved.size() << "conflicts with"
            << resolutionChoiceToString(choice);
    return resolved;
}

QList<ResolvedRecord> ConflictResolver::resolveAll(ResolutionChoice choice)
{
    QStringList ids;
    for (const ConflictGroup &group : m_conflicts) {
        ids << group.id;
    }
    return resolveBatch(ids, choice);
}

QList<ResolvedRecord> ConflictResolver::resolveByStore(const QString &collection, ResolutionChoice choice)
{
    QStringList ids;
    for (const ConflictGroup &group : m_conflicts) {
        if (group.collection == collection) {
            ids << group.id;
        }
    }
    return resolveBatch(ids, choice);
}

QJsonObject ConflictResolver::resolveConflictData(const ConflictGroup &group, ResolutionChoice choice)
{
    QJsonObject resolved;

    switch (choice) {
    case ResolutionChoice::Local:
        resolved = group.localData;
        break;

    case ResolutionChoice::Server:
        resolved = group.remoteData;
        break;

    case ResolutionChoice::Merge:
        resolved = group.remoteData;
        for (const FieldConflict &conflict : group.conflicts) {
            if (conflict.compare() <= 0) continue;

            if (conflict.localValue.isUndefined()) {
                resolved.remove(conflict.field);
            } else {
                resolved.insert(conflict.field, conflict.localValue);
            }
        }
        break;
    }

    return Records::withSynced(resolved, true);
}

// ========== Diagnosis ==========

ResolutionChoice ConflictResolver::diagnose(const QString &conflictId) const
{
    int index = indexOf(conflictId);
    if (index < 0) {
        return ResolutionChoice::Merge;
    }
    return diagnoseGroup(m_conflicts[index]);
}

ResolutionChoice ConflictResolver::diagnoseGroup(const ConflictGroup &group)
{
    int localNewer = 0;
    int remoteNewer = 0;
    int equal = 0;

    for (const FieldConflict &conflict : group.conflicts) {
        const int cmp = conflict.compare();
        if (cmp > 0) {
            localNewer++;
        } else if (cmp < 0) {
            remoteNewer++;
        } else {
            equal++;
        }
    }

    if (localNewer > remoteNewer && localNewer > equal) {
        return ResolutionChoice::Local;
    }
    if (remoteNewer > localNewer && remoteNewer > equal) {
        return ResolutionChoice::Server;
    }
    return ResolutionChoice::Merge;
}

QMap<QString, ResolutionChoice> ConflictResolver::getDiagnosis() const
{
    QMap<QString, ResolutionChoice> diagnosis;
    for (const ConflictGroup &group : m_conflicts) {
        diagnosis.insert(group.id, diagnoseGroup(group));
    }
    return diagnosis;
}

// ========== Maintenance ==========

bool ConflictResolver::removeConflict(const QString &conflictId)
{
    int index = indexOf(conflictId);
    if (index < 0) {
        return false;
    }

    m_conflicts.removeAt(index);
    save();
    emit conflictsChanged(m_conflicts.size());
    return true;
}

bool ConflictResolver::removeConflictFor(const QString &collection, const QString &recordId)
{
    int index = indexFor(collection, recordId);
    if (index < 0) {
        return false;
    }

    qDebug() << "[ConflictResolver] Dropping obsolete conflict" << m_conflicts[index].id
             << "for" << collection << recordId;
    m_conflicts.removeAt(index);
    save();
    emit conflictsChanged(m_conflicts.size());
    return true;
}

void ConflictResolver::clearAll()
{
    m_conflicts.clear();
    save();
    emit conflictsChanged(0);
}

ConflictStats ConflictResolver::stats() const
{
    ConflictStats stats;
    stats.total = m_conflicts.size();
    for (const ConflictGroup &group : m_conflicts) {
        stats.byStore[group.collection]++;
    }
    return stats;
}

// ========== Persistence ==========

bool ConflictResolver::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open conflicts file: %1").arg(m_filePath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "[ConflictResolver] Corrupt conflicts file, starting empty:" << parseError.errorString();
        emit errorOccurred(QString("Failed to parse conflicts: %1").arg(parseError.errorString()));
        return false;
    }

    m_conflicts.clear();
    const QJsonObject groups = doc.object()["conflicts"].toObject();
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        ConflictGroup group = ConflictGroup::fromJson(it.value().toObject());
        if (group.id.isEmpty()) {
            group.id = it.key();
        }
        if (group.isValid()) {
            m_conflicts.append(group);
        }
    }

    std::stable_sort(m_conflicts.begin(), m_conflicts.end(),
                     [](const ConflictGroup &a, const ConflictGroup &b) {
                         return a.createdAt < b.createdAt;
                     });

    qDebug() << "[ConflictResolver] Loaded" << m_conflicts.size() << "pending conflicts";
    return true;
}

bool ConflictResolver::save()
{
    QDir dir = QFileInfo(m_filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create conflicts directory: %1").arg(dir.path()));
        return false;
    }

    QJsonObject groups;
    for (const ConflictGroup &group : m_conflicts) {
        groups[group.id] = group.toJson();
    }

    QJsonObject root;
    root["version"] = 1;
    root["conflicts"] = groups;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save conflicts: %1").arg(m_filePath));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit conflicts: %1").arg(m_filePath));
        return false;
    }
    return true;
}

// ========== Helpers ==========

int ConflictResolver::indexOf(const QString &conflictId) const
{
    for (int i = 0; i < m_conflicts.size(); ++i) {
        if (m_conflicts[i].id == conflictId) {
            return i;
        }
    }
    return -1;
}

int ConflictResolver::indexFor(const QString &collection, const QString &recordId) const
{
    for (int i = 0; i < m_conflicts.size(); ++i) {
        if (m_conflicts[i].collection == collection && m_conflicts[i].recordId == recordId) {
            return i;
        }
    }
    return -1;
}

} // namespace Stash
