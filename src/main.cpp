#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>

#include <cstdio>

#include "stashsync_version.h"
#include "syncconfig.h"
#include "store/localstore.h"
#include "store/sqlitestorageengine.h"
#include "queue/retryqueue.h"
#include "conflict/conflictresolver.h"
#include "sync/environment.h"
#include "sync/syncmetadata.h"
#include "sync/syncengine.h"
#include "sync/healthcheck.h"
#include "sync/fileremotebackend.h"
#include "sync/adapters/builtinadapters.h"

using namespace Stash;

namespace {

bool g_verbose = false;

void messageHandler(QtMsgType type, const QMessageLogContext &, const QString &message)
{
    if (type == QtDebugMsg && !g_verbose) {
        return;
    }

    const char *level = "INFO";
    switch (type) {
        case QtDebugMsg:    level = "DEBUG"; break;
        case QtInfoMsg:     level = "INFO"; break;
        case QtWarningMsg:  level = "WARNING"; break;
        case QtCriticalMsg: level = "ERROR"; break;
        case QtFatalMsg:    level = "FATAL"; break;
    }

    fprintf(stderr, "[%s] %s\n", level, qPrintable(message));
    fflush(stderr);
}

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QString describeValue(const QJsonValue &value)
{
    if (value.isUndefined()) return "(missing)";
    if (value.isString()) return value.toString();
    if (value.isObject()) return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    if (value.isArray()) return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    return value.toVariant().toString();
}

// ========== Commands ==========

int cmdStatus(SyncEngine &engine, const SyncConfig &config)
{
    const SyncEnvironment &env = engine.environment();

    out() << "StashSync " << STASHSYNC_VERSION_STRING << "\n";
    out() << "State directory: " << config.resolvedStateDirectory() << "\n\n";

    for (const QString &name : engine.registeredCollections()) {
        const int total = env.store->getAll(name).size();
        const int unsynced = env.store->getUnsynced(name).size();
        const QDateTime last = env.metadata->lastSyncTime(name);
        out() << QString("  %1: %2 record(s), %3 unsynced, last sync %4")
                     .arg(name, -18).arg(total).arg(unsynced)
                     .arg(last.isValid() ? last.toString(Qt::ISODate) : QString("never"))
              << "\n";
        const QString error = env.metadata->info(name).lastError;
        if (!error.isEmpty()) {
            out() << "      last error: " << error << "\n";
        }
    }

    out() << "\nHealth:\n";
    HealthCheck health(env, config);
    const QList<HealthResult> results = health.run();
    for (const HealthResult &r : results) {
        out() << QString("  [%1] %2: %3")
                     .arg(r.passed ? QString("ok") : healthSeverityToString(r.severity), r.system, r.message)
              << "\n";
    }
    out().flush();

    return HealthCheck::overallSeverity(results) == HealthSeverity::Critical ? 2 : 0;
}

int cmdSync(SyncEngine &engine)
{
    const SyncResults results = engine.syncAll();
    if (results.isEmpty()) {
        out() << "Nothing synced (offline, no user, or already syncing)\n";
        out().flush();
        return 1;
    }

    bool ok = true;
    for (auto it = results.constBegin(); it != results.constEnd(); ++it) {
        out() << QString("  %1: %2").arg(it.key(), -18).arg(it.value().summary()) << "\n";
        for (const QString &error : it.value().errors) {
            out() << "      " << error << "\n";
        }
        ok = ok && it.value().success;
    }
    out().flush();
    return ok ? 0 : 1;
}

int cmdProcessQueue(SyncEngine &engine)
{
    const QueueProcessResult result = engine.processQueue();
    out() << result.summary() << "\n";
    out().flush();
    return result.failed > 0 ? 1 : 0;
}

int cmdConflicts(SyncEngine &engine)
{
    const QList<ConflictGroup> groups = engine.getConflicts();
    if (groups.isEmpty()) {
        out() << "No pending conflicts\n";
        out().flush();
        return 0;
    }

    const QMap<QString, ResolutionChoice> diagnosis = engine.getDiagnosis();
    for (const ConflictGroup &group : groups) {
        out() << group.id << "  " << group.collection << "/" << group.recordId;
        if (!group.recordName.isEmpty()) {
            out() << " \"" << group.recordName << "\"";
        }
        out() << "  (suggested: " << resolutionChoiceToString(diagnosis.value(group.id)) << ")\n";
        for (const FieldConflict &field : group.conflicts) {
            out() << "    " << field.field << ": local=" << describeValue(field.localValue)
                  << "  remote=" << describeValue(field.remoteValue) << "\n";
        }
    }
    out().flush();
    return 0;
}

int cmdResolve(SyncEngine &engine, const QStringList &args)
{
    if (args.size() < 2) {
        qCritical() << "Usage: resolve <conflict-id> <local|server|merge>";
        return 64;
    }

    ResolutionChoice choice;
    if (!resolutionChoiceFromString(args.at(1), &choice)) {
        qCritical() << "Unknown resolution:" << args.at(1);
        return 64;
    }

    if (!engine.resolveConflict(args.at(0), choice)) {
        return 1;
    }
    out() << "Resolved " << args.at(0) << " (" << resolutionChoiceToString(choice) << ")\n";
    out().flush();
    return 0;
}

int cmdResolveAll(SyncEngine &engine, const QStringList &args)
{
    if (args.isEmpty()) {
        qCritical() << "Usage: resolve-all <local|server|merge>";
        return 64;
    }

    ResolutionChoice choice;
    if (!resolutionChoiceFromString(args.at(0), &choice)) {
        qCritical() << "Unknown resolution:" << args.at(0);
        return 64;
    }

    const QList<ResolvedRecord> resolved = engine.resolveAll(choice);
    out() << "Resolved " << resolved.size() << " conflict(s)\n";
    out().flush();
    return 0;
}

int cmdPut(SyncEngine &engine, const QStringList &args)
{
    if (args.size() < 2) {
        qCritical() << "Usage: put <collection> <json-record>";
        return 64;
    }

    const QString collection = args.at(0);
    if (!engine.adapter(collection)) {
        qCritical() << "Unknown collection:" << collection;
        return 64;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(args.at(1).toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCritical() << "Invalid JSON record:" << parseError.errorString();
        return 64;
    }

    // Local edits always start unsynced
    QJsonObject record = Records::withSynced(doc.object(), false);
    LocalStore *store = engine.environment().store;
    if (!store->put(collection, record)) {
        qCritical() << "Failed to store record:" << store->lastError();
        return 1;
    }

    out() << "Stored " << collection << "/" << Records::idOf(record) << "\n";
    out().flush();
    return 0;
}

int cmdList(SyncEngine &engine, const QStringList &args)
{
    if (args.isEmpty()) {
        qCritical() << "Usage: list <collection>";
        return 64;
    }

    LocalStore *store = engine.environment().store;
    if (!store->hasSchema(args.at(0))) {
        qCritical() << "Unknown collection:" << args.at(0);
        return 64;
    }

    const QList<QJsonObject> records = store->getAll(args.at(0));
    for (const QJsonObject &record : records) {
        out() << QString::fromUtf8(QJsonDocument(record).toJson(QJsonDocument::Compact)) << "\n";
    }
    out().flush();
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("StashSync");
    app.setApplicationVersion(STASHSYNC_VERSION_STRING);
    app.setOrganizationName("StashSync");

    qInstallMessageHandler(messageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription("Offline-first record synchronization");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "file");
    QCommandLineOption stateDirOption("state-dir", "Directory for local state.", "dir");
    QCommandLineOption remoteOption({"r", "remote"}, "Directory of the file-backed remote.", "dir");
    QCommandLineOption userOption({"u", "user"}, "Signed-in user id.", "id");
    QCommandLineOption offlineOption("offline", "Behave as if the network were down.");
    QCommandLineOption verboseOption({"v", "verbose"}, "Show debug output.");
    parser.addOption(configOption);
    parser.addOption(stateDirOption);
    parser.addOption(remoteOption);
    parser.addOption(userOption);
    parser.addOption(offlineOption);
    parser.addOption(verboseOption);

    parser.addPositionalArgument("command",
        "status | sync | process-queue | conflicts | resolve <id> <choice> | "
        "resolve-all <choice> | put <collection> <json> | list <collection>");

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(64);
    }
    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    // ========== Configuration ==========

    SyncConfig config;
    if (parser.isSet(configOption) && !config.load(parser.value(configOption))) {
        qCritical() << "[main] Cannot read configuration" << parser.value(configOption);
        return 78;
    }
    if (parser.isSet(stateDirOption)) {
        config.stateDirectory = parser.value(stateDirOption);
    }
    g_verbose = parser.isSet(verboseOption) || config.debugLogging;

    const QString stateDir = config.resolvedStateDirectory();
    if (!QDir().mkpath(stateDir)) {
        qCritical() << "[main] Cannot create state directory" << stateDir;
        return 73;
    }

    const QString remoteDir = parser.isSet(remoteOption)
        ? parser.value(remoteOption) : QDir(stateDir).filePath("remote");

    // ========== Components ==========

    LocalStore store(new SqliteStorageEngine(config.databasePath()),
                     config.fallbackPath(), config.databaseName);
    if (!store.open()) {
        qWarning() << "[main] Primary storage unavailable, running on fallback:" << store.lastError();
    }

    RetryQueue queue(config.queuePath());
    ConflictResolver conflicts(config.conflictsPath());
    SyncMetadata metadata(config.metadataPath());
    FileRemoteBackend remote(remoteDir);
    StaticIdentityProvider identity(parser.value(userOption));
    ManualNetworkStatus network(!parser.isSet(offlineOption));

    SyncEnvironment env;
    env.store = &store;
    env.queue = &queue;
    env.conflicts = &conflicts;
    env.remote = &remote;
    env.identity = &identity;
    env.network = &network;
    env.metadata = &metadata;

    SyncEngine engine(env, config);
    for (CollectionAdapter *adapter : createBuiltinAdapters()) {
        engine.registerAdapter(adapter);
    }

    QObject::connect(&engine, &SyncEngine::errorOccurred, [](const QString &error) {
        qWarning().noquote() << "[SyncEngine]" << error;
    });
    QObject::connect(&queue, &RetryQueue::operationDropped,
                     [](const QueuedOperation &op, const QString &reason) {
        qCritical().noquote() << "[RetryQueue] Dropped" << op.collection << op.recordId()
                              << "- possible data loss:" << reason;
    });

    // ========== Dispatch ==========

    if (command == "status") return cmdStatus(engine, config);
    if (command == "sync") return cmdSync(engine);
    if (command == "process-queue") return cmdProcessQueue(engine);
    if (command == "conflicts") return cmdConflicts(engine);
    if (command == "resolve") return cmdResolve(engine, args);
    if (command == "resolve-all") return cmdResolveAll(engine, args);
    if (command == "put") return cmdPut(engine, args);
    if (command == "list") return cmdList(engine, args);

    qCritical() << "Unknown command:" << command;
    parser.showHelp(64);
    return 64;
}
