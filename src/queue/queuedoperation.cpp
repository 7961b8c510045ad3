#include "queuedoperation.h"
#include "../sync/collectionschema.h"

namespace Stash {

QString QueuedOperation::recordId() const
{
    return Records::idOf(payload);
}

QJsonObject QueuedOperation::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["collection"] = collection;
    obj["kind"] = operationKindToString(kind);
    obj["payload"] = payload;
    obj["attempts"] = attempts;
    obj["lastAttempt"] = Records::formatTimestamp(lastAttempt);
    obj["createdAt"] = Records::formatTimestamp(createdAt);
    obj["priority"] = priority;
    if (!lastError.isEmpty()) {
        obj["lastError"] = lastError;
    }
    return obj;
}

QueuedOperation QueuedOperation::fromJson(const QJsonObject &json)
{
    QueuedOperation op;
    op.id = json["id"].toString();
    op.collection = json["collection"].toString();
    op.kind = operationKindFromString(json["kind"].toString());
    op.payload = json["payload"].toObject();
    op.attempts = json["attempts"].toInt();
    op.lastAttempt = Records::parseTimestamp(json["lastAttempt"]);
    op.createdAt = Records::parseTimestamp(json["createdAt"]);
    op.priority = json["priority"].toInt(1);
    op.lastError = json["lastError"].toString();
    return op;
}

QueuedOperation makeSyncOperation(const QString &collection, const QJsonObject &record,
                                  int priority, const QString &error)
{
    QueuedOperation op;
    op.collection = collection;
    op.kind = OperationKind::Sync;
    op.payload = record;
    op.priority = priority;
    op.lastError = error;
    return op;
}

QueuedOperation makePullOperation(const QString &collection, int priority, const QString &error)
{
    QueuedOperation op;
    op.collection = collection;
    op.kind = OperationKind::Pull;
    op.priority = priority;
    op.lastError = error;
    return op;
}

} // namespace Stash
