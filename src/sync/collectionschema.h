#ifndef COLLECTIONSCHEMA_H
#define COLLECTIONSCHEMA_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QJsonObject>
#include <QJsonValue>

namespace Stash {

/**
 * @brief Declared shape of the records in one collection
 *
 * Every record is a JSON object with a non-empty string "id" and a boolean
 * "synced" flag. The schema names the fields that carry change timestamps
 * (first present one wins) and the fields that never take part in conflict
 * detection (owner ids and bookkeeping).
 */
struct CollectionSchema {
    QString name;
    QStringList timestampFields = defaultTimestampFields();
    QStringList ignoredFields = defaultIgnoredFields();
    int priority = 1;               ///< Push/retry priority, higher first
    bool incrementalPull = true;    ///< Remote honours an updated-since cursor

    CollectionSchema() = default;
    explicit CollectionSchema(const QString &collectionName) : name(collectionName) {}

    /**
     * @brief Whether a field is excluded from field-level comparison
     *
     * "id" and "synced" are always excluded, as are the timestamp fields:
     * they describe the change rather than being part of it.
     */
    bool isIgnored(const QString &field) const;

    /**
     * @brief Timestamp of a record, from the first timestamp field present
     * @return Invalid QDateTime when the record carries none
     */
    QDateTime timestampOf(const QJsonObject &record) const;

    /**
     * @brief Check a record against the schema before it is stored
     * @param error Receives a description of the problem, if any
     */
    bool validate(const QJsonObject &record, QString *error = nullptr) const;

    static QStringList defaultTimestampFields();
    static QStringList defaultIgnoredFields();
};

/**
 * @brief Helpers for the JSON records the engine moves around
 */
namespace Records {

extern const QString IdField;
extern const QString SyncedField;

QString idOf(const QJsonObject &record);
bool isSynced(const QJsonObject &record);
QJsonObject withSynced(QJsonObject record, bool synced);

/**
 * @brief Deep equality ignoring the "synced" flag
 */
bool sameContent(const QJsonObject &a, const QJsonObject &b);

/**
 * @brief Parse an ISO-8601 string or epoch-milliseconds number
 */
QDateTime parseTimestamp(const QJsonValue &value);

/**
 * @brief Three-way timestamp comparison; invalid sorts before any valid time
 * @return <0 if a is older, 0 if equal, >0 if a is newer
 */
int compareTimestamps(const QDateTime &a, const QDateTime &b);

QString formatTimestamp(const QDateTime &timestamp);

} // namespace Records

} // namespace Stash

#endif // COLLECTIONSCHEMA_H
