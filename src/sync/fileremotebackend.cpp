#include "fileremotebackend.h"
#include "collectionschema.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

#include <algorithm>

namespace Stash {

FileRemoteBackend::FileRemoteBackend(const QString &basePath, Clock *clock, QObject *parent)
    : RemoteBackend(parent)
    , m_basePath(basePath)
    , m_clock(clock ? clock : &m_systemClock)
{
}

void FileRemoteBackend::setRequiredColumns(const QString &table, const QStringList &columns)
{
    m_requiredColumns[table] = columns;
}

QString FileRemoteBackend::tablePath(const QString &table) const
{
    return QDir(m_basePath).filePath(table + ".json");
}

int FileRemoteBackend::rowCount(const QString &table) const
{
    QList<QJsonObject> rows;
    RemoteError error;
    return readTable(table, &rows, &error) ? rows.size() : 0;
}

// ========== Remote Operations ==========

PushResult FileRemoteBackend::push(const QString &table, const QList<QJsonObject> &rows, int timeoutMs)
{
    Q_UNUSED(timeoutMs);

    if (!m_reachable) {
        RemoteError error;
        error.networkFailure = true;
        error.message = QString("Network error: unable to reach %1").arg(m_basePath);
        return PushResult::failure(error);
    }

    // Validate the whole request first: a rejected upsert writes nothing
    QStringList required = m_requiredColumns.value(table);
    required.prepend(Records::IdField);
    for (const QJsonObject &row : rows) {
        for (const QString &column : required) {
            const QJsonValue value = row.value(column);
            if (value.isUndefined() || value.isNull()
                || (value.isString() && value.toString().isEmpty())) {
                RemoteError error;
                error.status = 400;
                error.code = "23502";
                error.message = QString("null value in column \"%1\" of relation \"%2\" violates not-null constraint")
                    .arg(column, table);
                return PushResult::failure(error);
            }
        }
    }

    QList<QJsonObject> stored;
    RemoteError error;
    if (!readTable(table, &stored, &error)) {
        return PushResult::failure(error);
    }

    QMap<QString, int> indexById;
    for (int i = 0; i < stored.size(); ++i) {
        indexById.insert(Records::idOf(stored[i]), i);
    }

    const QString syncedAt = Records::formatTimestamp(m_clock->now());
    for (QJsonObject row : rows) {
        row.insert(syncedAtColumn(), syncedAt);
        const QString id = Records::idOf(row);
        auto it = indexById.find(id);
        if (it != indexById.end()) {
            stored[it.value()] = row;
        } else {
            indexById.insert(id, stored.size());
            stored.append(row);
        }
    }

    if (!writeTable(table, stored, &error)) {
        return PushResult::failure(error);
    }

    qDebug() << "[FileRemoteBackend] Upserted" << rows.size() << "rows into" << table;
    return PushResult::success();
}

PullResult FileRemoteBackend::pull(const QString &table, const PullQuery &query, int timeoutMs)
{
    Q_UNUSED(timeoutMs);

    if (!m_reachable) {
        RemoteError error;
        error.networkFailure = true;
        error.message = QString("Network error: unable to reach %1").arg(m_basePath);
        return PullResult::failure(error);
    }

    QList<QJsonObject> stored;
    RemoteError error;
    if (!readTable(table, &stored, &error)) {
        return PullResult::failure(error);
    }

    PullResult result;
    for (const QJsonObject &row : stored) {
        if (!query.ownerField.isEmpty()
            && row.value(query.ownerField).toString() != query.ownerId) {
            continue;
        }
        if (query.updatedSince.isValid()) {
            QDateTime ts = Records::parseTimestamp(row.value(query.cursorField));
            if (Records::compareTimestamps(ts, query.updatedSince) < 0) {
                continue;
            }
        }
        result.records.append(row);
    }

    // Limited pulls want the newest edits; full and incremental ones arrival order
    const QString field = query.limit > 0 ? query.timestampField : query.cursorField;
    auto timestampOf = [&field](const QJsonObject &row) {
        return Records::parseTimestamp(row.value(field));
    };

    if (query.limit > 0) {
        std::stable_sort(result.records.begin(), result.records.end(),
                         [&timestampOf](const QJsonObject &a, const QJsonObject &b) {
                             return Records::compareTimestamps(timestampOf(a), timestampOf(b)) > 0;
                         });
        if (result.records.size() > query.limit) {
            result.records = result.records.mid(0, query.limit);
        }
    } else {
        std::stable_sort(result.records.begin(), result.records.end(),
                         [&timestampOf](const QJsonObject &a, const QJsonObject &b) {
                             return Records::compareTimestamps(timestampOf(a), timestampOf(b)) < 0;
                         });
    }

    qDebug() << "[FileRemoteBackend] Pulled" << result.records.size() << "rows from" << table;
    return result;
}

// ========== Storage ==========

bool FileRemoteBackend::readTable(const QString &table, QList<QJsonObject> *rows, RemoteError *error) const
{
    QFile file(tablePath(table));
    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        error->status = 503;
        error->message = QString("Cannot open table file: %1").arg(file.fileName());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        error->status = 500;
        error->message = QString("Corrupt table file %1: %2")
            .arg(file.fileName(), parseError.errorString());
        return false;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        if (value.isObject()) {
            rows->append(value.toObject());
        }
    }
    return true;
}

bool FileRemoteBackend::writeTable(const QString &table, const QList<QJsonObject> &rows, RemoteError *error)
{
    QDir dir(m_basePath);
    if (!dir.exists() && !dir.mkpath(".")) {
        error->status = 503;
        error->message = QString("Cannot create remote directory: %1").arg(m_basePath);
        return false;
    }

    QJsonArray array;
    for (const QJsonObject &row : rows) {
        array.append(row);
    }

    QSaveFile file(tablePath(table));
    if (!file.open(QIODevice::WriteOnly)) {
        error->status = 503;
        error->message = QString("Cannot write table file: %1").arg(file.fileName());
        return false;
    }

    file.write(QJsonDocument(array).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        error->status = 503;
        error->message = QString("Cannot commit table file: %1").arg(file.fileName());
        emit errorOccurred(error->message);
        return false;
    }
    return true;
}

} // namespace Stash
