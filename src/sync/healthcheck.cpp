#include "healthcheck.h"
#include "syncmetadata.h"
#include "../store/localstore.h"
#include "../queue/retryqueue.h"
#include "../conflict/conflictresolver.h"

namespace Stash {

namespace {

HealthResult makeResult(const QString &system, bool passed, HealthSeverity severity,
                        const QString &message)
{
    HealthResult result;
    result.system = system;
    result.passed = passed;
    result.severity = severity;
    result.message = message;
    return result;
}

int severityRank(HealthSeverity severity)
{
    switch (severity) {
        case HealthSeverity::Info:     return 0;
        case HealthSeverity::Warning:  return 1;
        case HealthSeverity::Critical: return 2;
    }
    return 0;
}

} // namespace

HealthCheck::HealthCheck(const SyncEnvironment &environment, const SyncConfig &config)
    : m_env(environment)
    , m_config(config)
    , m_clock(environment.clock ? environment.clock : SystemClock::instance())
{
}

QList<HealthResult> HealthCheck::run() const
{
    QList<HealthResult> results;

    if (m_env.network) results << checkNetwork();
    if (m_env.queue) {
        results << checkQueueBacklog();
        results << checkDeadLetters();
    }
    if (m_env.metadata) results << checkLastSync();
    if (m_env.conflicts) results << checkConflicts();
    if (m_env.store) results << checkStorage();

    return results;
}

HealthSeverity HealthCheck::overallSeverity(const QList<HealthResult> &results)
{
    HealthSeverity worst = HealthSeverity::Info;
    for (const HealthResult &r : results) {
        if (!r.passed && severityRank(r.severity) > severityRank(worst)) {
            worst = r.severity;
        }
    }
    return worst;
}

bool HealthCheck::allPassed(const QList<HealthResult> &results)
{
    for (const HealthResult &r : results) {
        if (!r.passed) return false;
    }
    return true;
}

// ========== Probes ==========

HealthResult HealthCheck::checkNetwork() const
{
    if (m_env.network->isOnline()) {
        return makeResult("network", true, HealthSeverity::Info, "Online");
    }
    return makeResult("network", false, HealthSeverity::Warning,
                      "Offline - changes are kept locally until the connection returns");
}

HealthResult HealthCheck::checkQueueBacklog() const
{
    const int size = m_env.queue->size();
    if (size > m_config.queueBacklogWarning) {
        return makeResult("queue", false, HealthSeverity::Warning,
                          QString("%1 operations waiting for retry (threshold %2)")
                              .arg(size).arg(m_config.queueBacklogWarning));
    }
    return makeResult("queue", true, HealthSeverity::Info,
                      QString("%1 operation(s) waiting for retry").arg(size));
}

HealthResult HealthCheck::checkDeadLetters() const
{
    const int count = m_env.queue->deadLetters().size();
    if (count > 0) {
        return makeResult("deadLetters", false, HealthSeverity::Critical,
                          QString("%1 operation(s) exhausted their retries; changes may be lost")
                              .arg(count));
    }
    return makeResult("deadLetters", true, HealthSeverity::Info, "No dropped operations");
}

HealthResult HealthCheck::checkLastSync() const
{
    const QDateTime last = m_env.metadata->lastSyncTime();
    if (!last.isValid()) {
        return makeResult("lastSync", false, HealthSeverity::Warning, "Never synced");
    }

    const qint64 ageHours = last.secsTo(m_clock->now()) / 3600;
    if (ageHours >= m_config.staleSyncHours) {
        return makeResult("lastSync", false, HealthSeverity::Warning,
                          QString("Last sync %1 hour(s) ago").arg(ageHours));
    }
    return makeResult("lastSync", true, HealthSeverity::Info,
                      QString("Last sync at %1").arg(last.toString(Qt::ISODate)));
}

HealthResult HealthCheck::checkConflicts() const
{
    const int count = m_env.conflicts->count();
    if (count > 0) {
        return makeResult("conflicts", false, HealthSeverity::Warning,
                          QString("%1 conflict(s) awaiting resolution").arg(count));
    }
    return makeResult("conflicts", true, HealthSeverity::Info, "No pending conflicts");
}

HealthResult HealthCheck::checkStorage() const
{
    if (m_env.store->isDegraded()) {
        return makeResult("storage", false, HealthSeverity::Warning,
                          "Primary storage unavailable, writing to fallback");
    }
    return makeResult("storage", true, HealthSeverity::Info, "Primary storage available");
}

} // namespace Stash
