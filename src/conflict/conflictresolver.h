#ifndef CONFLICTRESOLVER_H
#define CONFLICTRESOLVER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>

#include "conflictgroup.h"
#include "../sync/collectionschema.h"
#include "../sync/synctypes.h"

namespace Stash {

class Clock;

/**
 * @brief Field-level conflict detection and the pending-conflict list
 *
 * Detection and resolution of a single group are pure functions of their
 * inputs and the collection schema. The resolver also keeps the list of
 * pending groups, persisted to a JSON file keyed by conflict id, with at
 * most one group per (collection, record id).
 *
 * Diagnosis only recommends a choice; nothing is ever resolved
 * automatically.
 */
class ConflictResolver : public QObject
{
    Q_OBJECT

public:
    /**
     * @param filePath JSON file pending groups persist to; loaded immediately
     * @param clock Time source, the system clock when null
     */
    explicit ConflictResolver(const QString &filePath, Clock *clock = nullptr, QObject *parent = nullptr);
    ~ConflictResolver() override;

    void registerSchema(const CollectionSchema &schema);
    CollectionSchema schemaFor(const QString &collection) const;

    /**
     * @brief Records resolved per chunk before yielding to the event loop
     */
    void setChunkSize(int size) { m_chunkSize = size > 0 ? size : 10; }
    int chunkSize() const { return m_chunkSize; }

    // ========== Detection ==========

    /**
     * @brief Compare a local and a remote copy of one record
     *
     * No conflict when the copies are deep-equal, when the local copy is
     * synced and the remote one is strictly newer, or when they only
     * differ in ignored fields.
     *
     * @return Populated group, or an invalid group when there is no conflict
     */
    ConflictGroup detectConflicts(const QString &collection,
                                  const QString &recordId,
                                  const QJsonObject &local,
                                  const QJsonObject &remote,
                                  const QString &recordName = QString()) const;

    // ========== Pending Conflicts ==========

    /**
     * @brief Register a group as pending
     *
     * If a group for the same record is already pending it is refreshed in
     * place and keeps its id.
     *
     * @return The id under which the group is stored
     */
    QString addConflict(const ConflictGroup &group);

    QList<ConflictGroup> getConflicts() const { return m_conflicts; }
    QList<ConflictGroup> getConflictsByStore(const QString &collection) const;

    /**
     * @brief Look up a pending group
     * @return Invalid group when unknown
     */
    ConflictGroup conflict(const QString &conflictId) const;

    bool hasConflictFor(const QString &collection, const QString &recordId) const;
    int count() const { return m_conflicts.size(); }

    // ========== Resolution ==========

    /**
     * @brief Resolve one pending group and remove it
     * @return false when the id is unknown
     */
    bool resolveConflict(const QString &conflictId, ResolutionChoice choice, ResolvedRecord *resolved);

    /**
     * @brief Resolve several groups with the same choice
     *
     * Works in chunks, yielding to the event loop between them. Unknown
     * ids are logged and skipped.
     */
    QList<ResolvedRecord> resolveBatch(const QStringList &conflictIds, ResolutionChoice choice);
    QList<ResolvedRecord> resolveAll(ResolutionChoice choice);
    QList<ResolvedRecord> resolveByStore(const QString &collection, ResolutionChoice choice);

    /**
     * @brief Compute the record a choice produces, without touching the list
     *
     * local and server take that side's copy. merge starts from the remote
     * copy and takes every conflicting field whose local timestamp is
     * strictly later. The result is always flagged synced.
     */
    static QJsonObject resolveConflictData(const ConflictGroup &group, ResolutionChoice choice);

    // ========== Diagnosis ==========

    /**
     * @brief Recommended choice for a pending group
     *
     * local or server when that side is newer on strictly more fields than
     * both other outcomes; merge otherwise, and for unknown ids.
     */
    ResolutionChoice diagnose(const QString &conflictId) const;
    static ResolutionChoice diagnoseGroup(const ConflictGroup &group);

    QMap<QString, ResolutionChoice> getDiagnosis() const;

    // ========== Maintenance ==========

    bool removeConflict(const QString &conflictId);

    /**
     * @brief Drop the pending group for a record, if any
     *
     * Used once the remote already holds what the record holds locally,
     * so the group no longer describes a real disagreement.
     */
    bool removeConflictFor(const QString &collection, const QString &recordId);
    void clearAll();
    ConflictStats stats() const;

    bool load();
    bool save();

signals:
    void conflictsChanged(int count);
    void errorOccurred(const QString &error);

private:
    int indexOf(const QString &conflictId) const;
    int indexFor(const QString &collection, const QString &recordId) const;

    QString m_filePath;
    Clock *m_clock;
    int m_chunkSize = 10;
    QMap<QString, CollectionSchema> m_schemas;
    QList<ConflictGroup> m_conflicts;
};

} // namespace Stash

#endif // CONFLICTRESOLVER_H
