#ifndef CONFLICTGROUP_H
#define CONFLICTGROUP_H

#include <QString>
#include <QList>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>
#include <QMetaType>

#include "../sync/synctypes.h"

namespace Stash {

/**
 * @brief One field whose local and remote values differ
 *
 * The timestamps are those of the whole records the values came from.
 */
struct FieldConflict {
    QString id;                 ///< "<group id>-<field>"
    QString field;
    QJsonValue localValue;
    QJsonValue remoteValue;
    QDateTime localTimestamp;
    QDateTime remoteTimestamp;

    /**
     * @brief <0 remote newer, 0 equal (or both unknown), >0 local newer
     */
    int compare() const;

    QJsonObject toJson() const;
    static FieldConflict fromJson(const QJsonObject &json);
};

/**
 * @brief Pending disagreement between the local and remote copy of a record
 *
 * A default-constructed group is invalid and stands for "no conflict".
 */
struct ConflictGroup {
    QString id;                 ///< "<collection>-<record id>-<msecs>"
    QString collection;
    QString recordId;
    QString recordName;         ///< Display name, may be empty
    QList<FieldConflict> conflicts;
    QJsonObject localData;
    QJsonObject remoteData;
    QDateTime createdAt;

    bool isValid() const { return !id.isEmpty() && !conflicts.isEmpty(); }

    QStringList fieldNames() const;

    QJsonObject toJson() const;
    static ConflictGroup fromJson(const QJsonObject &json);
};

/**
 * @brief Record produced by resolving a conflict group
 */
struct ResolvedRecord {
    QString conflictId;
    QString collection;
    QString recordId;
    ResolutionChoice choice = ResolutionChoice::Merge;
    QJsonObject data;
};

} // namespace Stash

Q_DECLARE_METATYPE(Stash::ConflictGroup)

#endif // CONFLICTGROUP_H
