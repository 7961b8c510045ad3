#include "conflictgroup.h"
#include "../sync/collectionschema.h"

#include <QJsonArray>

namespace Stash {

namespace {

// QJsonObject drops undefined values; keep "field absent on one side" visible
QJsonValue encodeValue(const QJsonValue &value)
{
    return value.isUndefined() ? QJsonValue(QJsonValue::Null) : value;
}

} // namespace

// ========== FieldConflict ==========

int FieldConflict::compare() const
{
    return Records::compareTimestamps(localTimestamp, remoteTimestamp);
}

QJsonObject FieldConflict::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["field"] = field;
    obj["localValue"] = encodeValue(localValue);
    obj["remoteValue"] = encodeValue(remoteValue);
    obj["localTimestamp"] = Records::formatTimestamp(localTimestamp);
    obj["remoteTimestamp"] = Records::formatTimestamp(remoteTimestamp);
    return obj;
}

FieldConflict FieldConflict::fromJson(const QJsonObject &json)
{
    FieldConflict conflict;
    conflict.id = json["id"].toString();
    conflict.field = json["field"].toString();
    conflict.localValue = json["localValue"];
    conflict.remoteValue = json["remoteValue"];
    conflict.localTimestamp = Records::parseTimestamp(json["localTimestamp"]);
    conflict.remoteTimestamp = Records::parseTimestamp(json["remoteTimestamp"]);
    return conflict;
}

// ========== ConflictGroup ==========

QStringList ConflictGroup::fieldNames() const
{
    QStringList names;
    for (const FieldConflict &conflict : conflicts) {
        names << conflict.field;
    }
    return names;
}

QJsonObject ConflictGroup::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["collection"] = collection;
    obj["recordId"] = recordId;
    if (!recordName.isEmpty()) {
        obj["recordName"] = recordName;
    }

    QJsonArray conflictArray;
    for (const FieldConflict &conflict : conflicts) {
        conflictArray.append(conflict.toJson());
    }
    obj["conflicts"] = conflictArray;

    obj["localData"] = localData;
    obj["remoteData"] = remoteData;
    obj["createdAt"] = Records::formatTimestamp(createdAt);
    return obj;
}

ConflictGroup ConflictGroup::fromJson(const QJsonObject &json)
{
    ConflictGroup group;
    group.id = json["id"].toString();
    group.collection = json["collection"].toString();
    group.recordId = json["recordId"].toString();
    group.recordName = json["recordName"].toString();

    const QJsonArray conflictArray = json["conflicts"].toArray();
    for (const QJsonValue &val : conflictArray) {
        group.conflicts.append(FieldConflict::fromJson(val.toObject()));
    }

    group.localData = json["localData"].toObject();
    group.remoteData = json["remoteData"].toObject();
    group.createdAt = Records::parseTimestamp(json["createdAt"]);

    // A field missing from a side was stored as null
    for (FieldConflict &conflict : group.conflicts) {
        if (!group.localData.contains(conflict.field)) {
            conflict.localValue = QJsonValue(QJsonValue::Undefined);
        }
        if (!group.remoteData.contains(conflict.field)) {
            conflict.remoteValue = QJsonValue(QJsonValue::Undefined);
        }
    }
    return group;
}

} // namespace Stash
