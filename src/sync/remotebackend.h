#ifndef REMOTEBACKEND_H
#define REMOTEBACKEND_H

#include <QObject>
#include <QString>
#include <QList>
#include <QDateTime>
#include <QJsonObject>

#include "synctypes.h"

namespace Stash {

/**
 * @brief Failure reported by a remote call
 *
 * Carries enough shape to tell a transient failure (worth retrying as a
 * whole later) from a data-level one (worth isolating record by record).
 */
struct RemoteError {
    int status = 0;             ///< HTTP-like status, 0 when there was no response
    QString code;               ///< Backend error code, e.g. SQLSTATE "23505"
    QString message;
    bool timedOut = false;
    bool networkFailure = false;

    QString describe() const;
};

/**
 * @brief Decide whether a remote failure is transient or data-level
 *
 * Transient: timeouts, network failures, status 408, 429 or >= 500,
 * connection-class codes (08xxx, 57014), and network-shaped messages on
 * errors that carry neither a status nor a code.
 * Everything else, including constraint (23xxx) and data (22xxx) codes,
 * is data-level.
 */
RemoteErrorClass classifyRemoteError(const RemoteError &error);

struct PushResult {
    bool ok = true;
    RemoteError error;

    static PushResult success() { return PushResult(); }
    static PushResult failure(const RemoteError &error) {
        PushResult result;
        result.ok = false;
        result.error = error;
        return result;
    }
};

/**
 * @brief Wire column the remote stamps with its own clock on every upsert
 *
 * Client timestamps say when a record was edited, which can be long before
 * it reaches the remote. Incremental pulls key on this column instead.
 */
inline const char *syncedAtColumn() { return "synced_at"; }

/**
 * @brief Filter for a pull
 */
struct PullQuery {
    QString ownerField;             ///< Wire column holding the owner id
    QString ownerId;
    QString timestampField = "updated_at";      ///< Orders rows for a limited pull
    QString cursorField = syncedAtColumn();     ///< Compared against updatedSince
    QDateTime updatedSince;         ///< Invalid: full pull; else rows stored at or after it
    int limit = 0;                  ///< 0: unlimited; otherwise newest first
};

struct PullResult {
    bool ok = true;
    QList<QJsonObject> records;     ///< Wire-shaped rows
    RemoteError error;

    static PullResult failure(const RemoteError &error) {
        PullResult result;
        result.ok = false;
        result.error = error;
        return result;
    }
};

/**
 * @brief Abstract client for the remote store
 *
 * push() must be an idempotent upsert by id: the engine delivers
 * at-least-once and may repeat a push after a timeout. A backend that
 * supports incremental pulls stamps syncedAtColumn() on every row it
 * stores and returns it on pull.
 */
class RemoteBackend : public QObject
{
    Q_OBJECT

public:
    explicit RemoteBackend(QObject *parent = nullptr) : QObject(parent) {}
    ~RemoteBackend() override = default;

    // ========== Backend Identity ==========

    virtual QString backendId() const = 0;
    virtual QString displayName() const = 0;

    // ========== Remote Operations ==========

    /**
     * @brief Upsert wire-shaped rows into a remote table
     */
    virtual PushResult push(const QString &table, const QList<QJsonObject> &rows, int timeoutMs) = 0;

    /**
     * @brief Fetch wire-shaped rows matching a query
     */
    virtual PullResult pull(const QString &table, const PullQuery &query, int timeoutMs) = 0;

signals:
    void errorOccurred(const QString &error);
};

} // namespace Stash

#endif // REMOTEBACKEND_H
