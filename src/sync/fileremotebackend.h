#ifndef FILEREMOTEBACKEND_H
#define FILEREMOTEBACKEND_H

#include "remotebackend.h"
#include "environment.h"

#include <QString>
#include <QStringList>
#include <QMap>

namespace Stash {

/**
 * @brief Remote backend that keeps each table as a JSON file
 *
 * Layout:
 *   <basePath>/
 *   ├── game_progress.json
 *   ├── achievements.json
 *   └── ...
 *
 * Each file is a JSON array of rows keyed by "id". Used by the command
 * line front end and for offline demos; it behaves like a remote with
 * upsert-by-id semantics and reports errors in the same shape.
 *
 * Every stored row gets a "synced_at" stamp from the backend's clock, so
 * incremental pulls see rows in arrival order whatever their edit time.
 */
class FileRemoteBackend : public RemoteBackend
{
    Q_OBJECT

public:
    /**
     * @param clock Source of the "synced_at" stamp; the system clock when null
     */
    explicit FileRemoteBackend(const QString &basePath, Clock *clock = nullptr,
                               QObject *parent = nullptr);
    ~FileRemoteBackend() override = default;

    QString backendId() const override { return "file"; }
    QString displayName() const override { return "Local JSON Files"; }

    PushResult push(const QString &table, const QList<QJsonObject> &rows, int timeoutMs) override;
    PullResult pull(const QString &table, const PullQuery &query, int timeoutMs) override;

    // ========== Configuration ==========

    QString basePath() const { return m_basePath; }

    /**
     * @brief Simulate an unreachable remote: every call fails as a network error
     */
    void setReachable(bool reachable) { m_reachable = reachable; }
    bool isReachable() const { return m_reachable; }

    /**
     * @brief Columns that must be present and non-null in every pushed row
     *
     * "id" is always required.
     */
    void setRequiredColumns(const QString &table, const QStringList &columns);

    /**
     * @brief Number of rows currently stored for a table
     */
    int rowCount(const QString &table) const;

    QString tablePath(const QString &table) const;

private:
    bool readTable(const QString &table, QList<QJsonObject> *rows, RemoteError *error) const;
    bool writeTable(const QString &table, const QList<QJsonObject> &rows, RemoteError *error);

    QString m_basePath;
    SystemClock m_systemClock;
    Clock *m_clock;
    bool m_reachable = true;
    QMap<QString, QStringList> m_requiredColumns;
};

} // namespace Stash

#endif // FILEREMOTEBACKEND_H
