#include "retryqueue.h"
#include "../sync/environment.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QUuid>
#include <QDebug>

#include <algorithm>
#include <exception>

namespace Stash {

namespace {

// Clears the processing flag on every exit path
struct ProcessingGuard {
    bool &flag;
    explicit ProcessingGuard(bool &f) : flag(f) { flag = true; }
    ~ProcessingGuard() { flag = false; }
};

} // namespace

RetryQueue::RetryQueue(const QString &filePath, Clock *clock, QObject *parent)
    : QObject(parent)
    , m_filePath(filePath)
    , m_clock(clock ? clock : SystemClock::instance())
{
    load();
}

RetryQueue::~RetryQueue() = default;

void RetryQueue::setOptions(const RetryQueueOptions &options)
{
    m_options = options;
}

// ========== Queue Operations ==========

bool RetryQueue::add(const QueuedOperation &op)
{
    if (op.collection.isEmpty()) {
        qWarning() << "[RetryQueue] Rejected operation without collection";
        return false;
    }

    // Same record already waiting: refresh it rather than queue twice
    int existing = indexOfPending(op);
    if (existing >= 0) {
        QueuedOperation &queued = m_operations[existing];
        queued.payload = op.payload;
        queued.priority = op.priority;
        if (!op.lastError.isEmpty()) {
            queued.lastError = op.lastError;
        }
        sortQueue();
        save();
        qDebug() << "[RetryQueue] Refreshed queued" << operationKindToString(op.kind)
                 << "for" << op.collection << op.recordId();
        return true;
    }

    if (m_operations.size() >= m_options.capacity) {
        qWarning() << "[RetryQueue] Queue full (" << m_options.capacity
                   << "), rejecting" << operationKindToString(op.kind) << "for" << op.collection;
        emit errorOccurred(QString("Retry queue is full, %1 operation for %2 rejected")
                               .arg(operationKindToString(op.kind), op.collection));
        return false;
    }

    QueuedOperation queued = op;
    queued.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    queued.attempts = 0;
    queued.createdAt = now();
    queued.lastAttempt = queued.createdAt;

    m_operations.append(queued);
    sortQueue();
    save();

    qDebug() << "[RetryQueue] Added" << operationKindToString(queued.kind)
             << "operation for" << queued.collection;
    emit queueChanged(m_operations.size());
    return true;
}

QueueProcessResult RetryQueue::processQueue(const Processor &processor)
{
    QueueProcessResult result;

    if (m_processing) {
        qDebug() << "[RetryQueue] Already processing";
        result.remaining = m_operations.size();
        return result;
    }

    ProcessingGuard guard(m_processing);

    const QList<QueuedOperation> snapshot = m_operations;
    for (const QueuedOperation &queued : snapshot) {
        int index = indexOf(queued.id);
        if (index < 0) {
            continue;  // Removed while we were working
        }

        if (m_operations[index].attempts >= m_options.maxAttempts) {
            drop(index, "Max attempts reached");
            result.failed++;
            result.dropped++;
            continue;
        }

        const qint64 delay = retryDelay(m_operations[index].attempts);
        const qint64 elapsed = m_operations[index].lastAttempt.msecsTo(now());
        if (elapsed < delay) {
            result.skipped++;
            continue;
        }

        m_operations[index].attempts++;
        m_operations[index].lastAttempt = now();
        save();

        const QueuedOperation current = m_operations[index];
        QString error;
        bool ok = false;
        try {
            ok = processor(current, &error);
        } catch (const std::exception &e) {
            ok = false;
            error = QString::fromUtf8(e.what());
        }

        index = indexOf(current.id);
        if (ok) {
            if (index >= 0) {
                m_operations.removeAt(index);
                save();
                emit queueChanged(m_operations.size());
            }
            result.processed++;
            qDebug() << "[RetryQueue] Processed" << operationKindToString(current.kind)
                     << "for" << current.collection;
        } else {
            result.failed++;
            if (error.isEmpty()) {
                error = "Unknown error";
            }
            qWarning() << "[RetryQueue] Failed" << operationKindToString(current.kind)
                       << "for" << current.collection << "attempt" << current.attempts
                       << ":" << error;
            if (index >= 0) {
                m_operations[index].lastError = error;
                if (m_operations[index].attempts >= m_options.maxAttempts) {
                    drop(index, error);
                    result.dropped++;
                } else {
                    save();
                }
            }
        }

        yieldToEventLoop();
    }

    result.remaining = m_operations.size();
    return result;
}

qint64 RetryQueue::retryDelay(int attempts) const
{
    qint64 delay = m_options.baseDelayMs;
    for (int i = 0; i < attempts && delay < m_options.maxDelayMs; ++i) {
        delay *= 2;
    }
    return std::min(delay, m_options.maxDelayMs);
}

bool RetryQueue::remove(const QString &id)
{
    int index = indexOf(id);
    if (index < 0) {
        return false;
    }

    m_operations.removeAt(index);
    save();
    emit queueChanged(m_operations.size());
    return true;
}

void RetryQueue::clear()
{
    m_operations.clear();
    save();
    emit queueChanged(0);
}

bool RetryQueue::hasPending(const QString &collection, OperationKind kind, const QString &recordId) const
{
    for (const QueuedOperation &op : m_operations) {
        if (op.collection != collection || op.kind != kind) continue;
        if (kind == OperationKind::Pull || op.recordId() == recordId) {
            return true;
        }
    }
    return false;
}

QueueStats RetryQueue::stats() const
{
    QueueStats stats;
    stats.total = m_operations.size();
    stats.deadLetters = m_deadLetters.size();

    int totalAttempts = 0;
    for (const QueuedOperation &op : m_operations) {
        stats.byCollection[op.collection]++;
        stats.byKind[operationKindToString(op.kind)]++;
        totalAttempts += op.attempts;
    }
    if (stats.total > 0) {
        stats.averageAttempts = static_cast<double>(totalAttempts) / stats.total;
    }
    return stats;
}

// ========== Dead Letters ==========

void RetryQueue::clearDeadLetters()
{
    if (m_deadLetters.isEmpty()) return;

    m_deadLetters.clear();
    save();
}

void RetryQueue::drop(int index, const QString &reason)
{
    QueuedOperation op = m_operations.takeAt(index);
    op.lastError = reason;

    m_deadLetters.append(op);
    while (m_deadLetters.size() > m_options.capacity) {
        m_deadLetters.removeFirst();
    }
    save();

    qCritical() << "[RetryQueue] Dropped" << operationKindToString(op.kind) << "for"
                << op.collection << op.recordId() << "after" << op.attempts
                << "attempts, data may be lost:" << reason;
    emit operationDropped(op, reason);
    emit queueChanged(m_operations.size());
}

// ========== Persistence ==========

bool RetryQueue::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open retry queue: %1").arg(m_filePath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        qWarning() << "[RetryQueue] Corrupt queue file, starting empty:" << parseError.errorString();
        emit errorOccurred(QString("Failed to parse retry queue: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();

    m_operations.clear();
    const QJsonArray operations = root["operations"].toArray();
    for (const QJsonValue &val : operations) {
        QueuedOperation op = QueuedOperation::fromJson(val.toObject());
        if (op.isValid()) {
            m_operations.append(op);
        }
    }
    sortQueue();

    m_deadLetters.clear();
    const QJsonArray deadLetters = root["deadLetters"].toArray();
    for (const QJsonValue &val : deadLetters) {
        QueuedOperation op = QueuedOperation::fromJson(val.toObject());
        if (op.isValid()) {
            m_deadLetters.append(op);
        }
    }

    qDebug() << "[RetryQueue] Loaded" << m_operations.size() << "operations,"
             << m_deadLetters.size() << "dead letters";
    return true;
}

bool RetryQueue::save()
{
    QDir dir = QFileInfo(m_filePath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create queue directory: %1").arg(dir.path()));
        return false;
    }

    QJsonObject root;
    root["version"] = 1;

    QJsonArray operations;
    for (const QueuedOperation &op : m_operations) {
        operations.append(op.toJson());
    }
    root["operations"] = operations;

    QJsonArray deadLetters;
    for (const QueuedOperation &op : m_deadLetters) {
        deadLetters.append(op.toJson());
    }
    root["deadLetters"] = deadLetters;

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save retry queue: %1").arg(m_filePath));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit retry queue: %1").arg(m_filePath));
        return false;
    }
    return true;
}

// ========== Helpers ==========

int RetryQueue::indexOf(const QString &id) const
{
    for (int i = 0; i < m_operations.size(); ++i) {
        if (m_operations[i].id == id) {
            return i;
        }
    }
    return -1;
}

int RetryQueue::indexOfPending(const QueuedOperation &op) const
{
    for (int i = 0; i < m_operations.size(); ++i) {
        const QueuedOperation &queued = m_operations[i];
        if (queued.collection != op.collection || queued.kind != op.kind) continue;
        if (op.kind == OperationKind::Pull) {
            return i;
        }
        const QString recordId = op.recordId();
        if (!recordId.isEmpty() && queued.recordId() == recordId) {
            return i;
        }
    }
    return -1;
}

void RetryQueue::sortQueue()
{
    std::stable_sort(m_operations.begin(), m_operations.end(),
                     [](const QueuedOperation &a, const QueuedOperation &b) {
                         if (a.priority != b.priority) {
                             return a.priority > b.priority;
                         }
                         return a.createdAt < b.createdAt;
                     });
}

QDateTime RetryQueue::now() const
{
    return m_clock->now();
}

} // namespace Stash
