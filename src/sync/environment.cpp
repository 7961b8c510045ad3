#include "environment.h"

#include <QTimer>
#include <QDebug>

namespace Stash {

SystemClock *SystemClock::instance()
{
    static SystemClock clock;
    return &clock;
}

// ========== ManualNetworkStatus ==========

ManualNetworkStatus::ManualNetworkStatus(bool online, QObject *parent)
    : NetworkStatus(parent)
    , m_online(online)
{
}

void ManualNetworkStatus::setOnline(bool online)
{
    if (m_online == online) {
        return;
    }

    m_online = online;
    qInfo() << "[NetworkStatus]" << (online ? "Online" : "Offline");

    if (online) {
        emit becameOnline();
    } else {
        emit wentOffline();
    }
}

// ========== TimerScheduler ==========

TimerScheduler::TimerScheduler(QObject *parent)
    : QObject(parent)
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &TimerScheduler::onTimeout);
}

TimerScheduler::~TimerScheduler()
{
    stop();
}

void TimerScheduler::start(int intervalMs, std::function<void()> task)
{
    m_task = std::move(task);
    m_timer->start(intervalMs);
    qDebug() << "[TimerScheduler] Started with interval:" << intervalMs << "ms";
}

void TimerScheduler::stop()
{
    if (!m_timer->isActive()) {
        return;
    }

    m_timer->stop();
    qDebug() << "[TimerScheduler] Stopped";
}

bool TimerScheduler::isActive() const
{
    return m_timer->isActive();
}

void TimerScheduler::onTimeout()
{
    if (m_task) {
        m_task();
    }
}

} // namespace Stash
