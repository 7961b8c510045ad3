#ifndef QUEUEDOPERATION_H
#define QUEUEDOPERATION_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

#include "../sync/synctypes.h"

namespace Stash {

/**
 * @brief A failed remote operation waiting to be replayed
 *
 * For OperationKind::Sync the payload is the local record that failed to
 * push; for OperationKind::Pull it is empty and the whole collection is
 * pulled again.
 */
struct QueuedOperation {
    QString id;
    QString collection;
    OperationKind kind = OperationKind::Sync;
    QJsonObject payload;
    int attempts = 0;
    QDateTime lastAttempt;
    QDateTime createdAt;
    int priority = 1;
    QString lastError;

    /**
     * @brief Id of the record this operation concerns, empty for pulls
     */
    QString recordId() const;

    QJsonObject toJson() const;
    static QueuedOperation fromJson(const QJsonObject &json);

    bool isValid() const { return !id.isEmpty() && !collection.isEmpty(); }
};

/**
 * @brief Convenience constructor for a record push retry
 */
QueuedOperation makeSyncOperation(const QString &collection, const QJsonObject &record,
                                  int priority, const QString &error = QString());

/**
 * @brief Convenience constructor for a collection pull retry
 */
QueuedOperation makePullOperation(const QString &collection, int priority,
                                  const QString &error = QString());

} // namespace Stash

Q_DECLARE_METATYPE(Stash::QueuedOperation)

#endif // QUEUEDOPERATION_H
