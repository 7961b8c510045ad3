#ifndef FALLBACKSTORE_H
#define FALLBACKSTORE_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QJsonObject>
#include <QSettings>

namespace Stash {

/**
 * @brief Secondary key/value store used while the primary engine is down
 *
 * Each collection is one INI value keyed "<db>_<collection>" and holding the
 * collection as a JSON array string. Writes are per-record. Reading a
 * missing or corrupt value yields an empty list.
 */
class FallbackStore
{
public:
    FallbackStore(const QString &filePath, const QString &databaseName);

    QString keyFor(const QString &collection) const;

    QList<QJsonObject> readAll(const QString &collection) const;
    QJsonObject read(const QString &collection, const QString &id) const;

    bool write(const QString &collection, const QJsonObject &record);
    bool remove(const QString &collection, const QString &id);
    bool removeIds(const QString &collection, const QStringList &ids);
    bool clear(const QString &collection);

    // Deletions made while degraded, replayed on the primary later
    bool addTombstone(const QString &collection, const QString &id);
    QStringList tombstones(const QString &collection) const;
    bool clearTombstones(const QString &collection, const QStringList &ids);

    /**
     * @brief Collections that currently hold fallback records or tombstones
     */
    QStringList collections() const;

    bool isEmpty() const { return collections().isEmpty(); }

    QString filePath() const { return m_settings.fileName(); }

private:
    bool store(const QString &collection, const QList<QJsonObject> &records);

    QString m_databaseName;
    mutable QSettings m_settings;
};

} // namespace Stash

#endif // FALLBACKSTORE_H
