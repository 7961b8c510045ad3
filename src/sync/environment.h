#ifndef ENVIRONMENT_H
#define ENVIRONMENT_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <functional>

class QTimer;

namespace Stash {

class LocalStore;
class RetryQueue;
class ConflictResolver;
class RemoteBackend;
class SyncMetadata;

// ========== Clock ==========

/**
 * @brief Source of wall-clock time
 *
 * Everything that stamps or compares times asks a Clock, so tests can run
 * backoff windows and staleness checks without sleeping.
 */
class Clock
{
public:
    virtual ~Clock() = default;
    virtual QDateTime now() const = 0;

    qint64 nowMSecs() const { return now().toMSecsSinceEpoch(); }
};

class SystemClock : public Clock
{
public:
    QDateTime now() const override { return QDateTime::currentDateTimeUtc(); }

    /**
     * @brief Process-wide instance used when no clock is injected
     */
    static SystemClock *instance();
};

// ========== Identity ==========

/**
 * @brief The signed-in user, as far as the sync engine cares
 */
struct Identity {
    QString userId;

    bool isValid() const { return !userId.isEmpty(); }
};

class IdentityProvider
{
public:
    virtual ~IdentityProvider() = default;

    /**
     * @brief Current user
     * @return Invalid identity when nobody is signed in
     */
    virtual Identity currentUser() const = 0;
};

class StaticIdentityProvider : public IdentityProvider
{
public:
    explicit StaticIdentityProvider(const QString &userId = QString()) { m_identity.userId = userId; }

    Identity currentUser() const override { return m_identity; }
    void setUserId(const QString &userId) { m_identity.userId = userId; }

private:
    Identity m_identity;
};

// ========== Network Status ==========

/**
 * @brief Connectivity indicator
 *
 * Emits becameOnline() on an offline-to-online transition; the sync engine
 * reacts by running a sync pass and a retry-queue run.
 */
class NetworkStatus : public QObject
{
    Q_OBJECT

public:
    explicit NetworkStatus(QObject *parent = nullptr) : QObject(parent) {}
    ~NetworkStatus() override = default;

    virtual bool isOnline() const = 0;

signals:
    void becameOnline();
    void wentOffline();
};

/**
 * @brief NetworkStatus driven by the host (or a test) calling setOnline()
 */
class ManualNetworkStatus : public NetworkStatus
{
    Q_OBJECT

public:
    explicit ManualNetworkStatus(bool online = true, QObject *parent = nullptr);

    bool isOnline() const override { return m_online; }

public slots:
    void setOnline(bool online);

private:
    bool m_online;
};

// ========== Periodic Scheduler ==========

/**
 * @brief Cancellable periodic task
 */
class PeriodicScheduler
{
public:
    virtual ~PeriodicScheduler() = default;

    /**
     * @brief Run task every intervalMs until stop(); restarting replaces the task
     */
    virtual void start(int intervalMs, std::function<void()> task) = 0;
    virtual void stop() = 0;
    virtual bool isActive() const = 0;
};

/**
 * @brief QTimer-backed scheduler; ticks are delivered by the event loop
 */
class TimerScheduler : public QObject, public PeriodicScheduler
{
    Q_OBJECT

public:
    explicit TimerScheduler(QObject *parent = nullptr);
    ~TimerScheduler() override;

    void start(int intervalMs, std::function<void()> task) override;
    void stop() override;
    bool isActive() const override;

private slots:
    void onTimeout();

private:
    QTimer *m_timer = nullptr;
    std::function<void()> m_task;
};

// ========== Environment ==========

/**
 * @brief Collaborators handed to the SyncEngine at construction
 *
 * The engine does not own any of these. Clock and scheduler may be left
 * null, in which case the system clock is used and auto-sync is disabled.
 */
struct SyncEnvironment {
    LocalStore *store = nullptr;
    RetryQueue *queue = nullptr;
    ConflictResolver *conflicts = nullptr;
    RemoteBackend *remote = nullptr;
    IdentityProvider *identity = nullptr;
    NetworkStatus *network = nullptr;
    Clock *clock = nullptr;
    PeriodicScheduler *scheduler = nullptr;
    SyncMetadata *metadata = nullptr;

    /**
     * @brief Whether every mandatory collaborator is present
     */
    bool isComplete() const {
        return store && queue && conflicts && remote && identity && network && metadata;
    }
};

} // namespace Stash

#endif // ENVIRONMENT_H
