#ifndef HEALTHCHECK_H
#define HEALTHCHECK_H

#include <QString>
#include <QList>

#include "synctypes.h"
#include "environment.h"
#include "../syncconfig.h"

namespace Stash {

/**
 * @brief Outcome of one health probe
 */
struct HealthResult {
    QString system;             ///< "network", "queue", "deadLetters", ...
    bool passed = true;
    HealthSeverity severity = HealthSeverity::Info;
    QString message;
};

/**
 * @brief Inspects engine state without touching the remote
 *
 * Probes, in order: network, queue backlog, dead letters, last sync age,
 * pending conflicts, storage. Probes whose collaborator is missing from the
 * environment are skipped.
 */
class HealthCheck
{
public:
    HealthCheck(const SyncEnvironment &environment, const SyncConfig &config = SyncConfig());

    QList<HealthResult> run() const;

    /**
     * @brief Worst severity among failed results; Info when all passed
     */
    static HealthSeverity overallSeverity(const QList<HealthResult> &results);

    static bool allPassed(const QList<HealthResult> &results);

private:
    HealthResult checkNetwork() const;
    HealthResult checkQueueBacklog() const;
    HealthResult checkDeadLetters() const;
    HealthResult checkLastSync() const;
    HealthResult checkConflicts() const;
    HealthResult checkStorage() const;

    SyncEnvironment m_env;
    SyncConfig m_config;
    Clock *m_clock;
};

} // namespace Stash

#endif // HEALTHCHECK_H
