#ifndef RETRYQUEUE_H
#define RETRYQUEUE_H

#include <QObject>
#include <QString>
#include <QList>
#include <functional>

#include "queuedoperation.h"
#include "../sync/synctypes.h"

namespace Stash {

class Clock;

/**
 * @brief Tuning for the retry queue
 */
struct RetryQueueOptions {
    int maxAttempts = 5;
    qint64 baseDelayMs = 2000;
    qint64 maxDelayMs = 300000;     ///< Backoff plateau
    int capacity = 1000;
};

/**
 * @brief Durable, priority-ordered list of failed remote operations
 *
 * Operations are kept sorted by priority (higher first) then creation time
 * (older first) and written through to a JSON file on every structural
 * change. processQueue() replays them with exponential backoff:
 *
 *   delay(attempts) = min(baseDelay * 2^attempts, maxDelay)
 *
 * An operation that reaches maxAttempts is dropped, appended to the
 * dead-letter list and reported through operationDropped().
 *
 * Only one processQueue() run is active at a time; a nested or concurrent
 * call returns immediately with zero processed.
 */
class RetryQueue : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Replays one operation
     * @return true on success; on failure fill *error
     */
    using Processor = std::function<bool(const QueuedOperation &op, QString *error)>;

    /**
     * @param filePath JSON file the queue persists to; loaded immediately
     * @param clock Time source, the system clock when null
     */
    explicit RetryQueue(const QString &filePath, Clock *clock = nullptr, QObject *parent = nullptr);
    ~RetryQueue() override;

    void setOptions(const RetryQueueOptions &options);
    RetryQueueOptions options() const { return m_options; }

    // ========== Queue Operations ==========

    /**
     * @brief Enqueue an operation
     *
     * Assigns id, attempts = 0 and lastAttempt = createdAt = now. A sync
     * operation for a record that is already queued replaces the queued
     * payload instead of adding a duplicate.
     *
     * @return false when the queue is at capacity
     */
    bool add(const QueuedOperation &op);

    /**
     * @brief Replay every operation whose backoff window has elapsed
     */
    QueueProcessResult processQueue(const Processor &processor);

    bool isProcessing() const { return m_processing; }

    /**
     * @brief Backoff before the next attempt after `attempts` failures
     */
    qint64 retryDelay(int attempts) const;

    QList<QueuedOperation> getAll() const { return m_operations; }
    int size() const { return m_operations.size(); }
    bool isEmpty() const { return m_operations.isEmpty(); }

    bool remove(const QString &id);
    void clear();

    /**
     * @brief Whether an operation for this collection/kind/record is queued
     *
     * recordId is ignored for pull operations.
     */
    bool hasPending(const QString &collection, OperationKind kind,
                    const QString &recordId = QString()) const;

    QueueStats stats() const;

    // ========== Dead Letters ==========

    QList<QueuedOperation> deadLetters() const { return m_deadLetters; }
    void clearDeadLetters();

    // ========== Persistence ==========

    bool load();
    bool save();

    QString filePath() const { return m_filePath; }

signals:
    void queueChanged(int size);

    /**
     * @brief An operation exhausted its attempts: potential data loss
     */
    void operationDropped(const Stash::QueuedOperation &op, const QString &reason);

    void errorOccurred(const QString &error);

private:
    int indexOf(const QString &id) const;
    int indexOfPending(const QueuedOperation &op) const;
    void sortQueue();
    void drop(int index, const QString &reason);
    QDateTime now() const;

    QString m_filePath;
    Clock *m_clock;
    RetryQueueOptions m_options;
    QList<QueuedOperation> m_operations;
    QList<QueuedOperation> m_deadLetters;
    bool m_processing = false;
};

} // namespace Stash

#endif // RETRYQUEUE_H
