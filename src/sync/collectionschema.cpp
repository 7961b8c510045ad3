#include "collectionschema.h"

#include <QTimeZone>

namespace Stash {

// ========== CollectionSchema ==========

QStringList CollectionSchema::defaultTimestampFields()
{
    return {"updatedAt", "updated_at", "createdAt", "created_at"};
}

QStringList CollectionSchema::defaultIgnoredFields()
{
    return {"user_id", "child_profile_id", "parent_user_id"};
}

bool CollectionSchema::isIgnored(const QString &field) const
{
    if (field == Records::IdField || field == Records::SyncedField) {
        return true;
    }
    return ignoredFields.contains(field) || timestampFields.contains(field);
}

QDateTime CollectionSchema::timestampOf(const QJsonObject &record) const
{
    for (const QString &field : timestampFields) {
        if (!record.contains(field)) continue;

        QDateTime ts = Records::parseTimestamp(record.value(field));
        if (ts.isValid()) {
            return ts;
        }
    }
    return QDateTime();
}

bool CollectionSchema::validate(const QJsonObject &record, QString *error) const
{
    const QJsonValue id = record.value(Records::IdField);
    if (!id.isString() || id.toString().isEmpty()) {
        if (error) *error = QString("%1: record has no string id").arg(name);
        return false;
    }

    if (record.contains(Records::SyncedField) && !record.value(Records::SyncedField).isBool()) {
        if (error) *error = QString("%1/%2: 'synced' must be a boolean").arg(name, id.toString());
        return false;
    }

    for (const QString &field : timestampFields) {
        if (!record.contains(field)) continue;
        const QJsonValue value = record.value(field);
        if (value.isNull()) continue;
        if (!Records::parseTimestamp(value).isValid()) {
            if (error) *error = QString("%1/%2: unreadable timestamp in '%3'")
                .arg(name, id.toString(), field);
            return false;
        }
    }

    return true;
}

// ========== Records ==========

namespace Records {

const QString IdField = QStringLiteral("id");
const QString SyncedField = QStringLiteral("synced");

QString idOf(const QJsonObject &record)
{
    return record.value(IdField).toString();
}

bool isSynced(const QJsonObject &record)
{
    return record.value(SyncedField).toBool(false);
}

QJsonObject withSynced(QJsonObject record, bool synced)
{
    record.insert(SyncedField, synced);
    return record;
}

bool sameContent(const QJsonObject &a, const QJsonObject &b)
{
    QJsonObject left = a;
    QJsonObject right = b;
    left.remove(SyncedField);
    right.remove(SyncedField);
    return left == right;
}

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (value.isDouble()) {
        return QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(value.toDouble()),
                                              QTimeZone::utc());
    }

    if (value.isString()) {
        const QString text = value.toString();
        QDateTime ts = QDateTime::fromString(text, Qt::ISODateWithMs);
        if (!ts.isValid()) {
            ts = QDateTime::fromString(text, Qt::ISODate);
        }
        return ts;
    }

    return QDateTime();
}

int compareTimestamps(const QDateTime &a, const QDateTime &b)
{
    if (!a.isValid() && !b.isValid()) return 0;
    if (!a.isValid()) return -1;
    if (!b.isValid()) return 1;

    const qint64 left = a.toMSecsSinceEpoch();
    const qint64 right = b.toMSecsSinceEpoch();
    if (left < right) return -1;
    if (left > right) return 1;
    return 0;
}

QString formatTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) {
        return QString();
    }
    return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

} // namespace Records

} // namespace Stash
