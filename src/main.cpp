#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QFileInfo>
#include <QMutex>
#include <QTextStream>
#include <QTimer>
#include <QDebug>
#include <cstdio>

#include "core/SyncSettings.h"
#include "core/catalog/CatalogDatabase.h"
#include "core/export/ExportWatcher.h"
#include "core/jobs/CheckpointStore.h"
#include "core/jobs/ImportStatus.h"
#include "core/jobs/JobExecutor.h"
#include "core/jobs/JobQueue.h"
#include "core/pipeline/BookOrganizer.h"
#include "core/pipeline/ContentHasher.h"
#include "core/pipeline/ImportPipeline.h"
#include "core/pipeline/ImportValidator.h"
#include "core/pipeline/NullEnricher.h"
#include "core/pipeline/SyncReconciler.h"
#include "core/writeback/WriteBackBatcher.h"
#include "core/writeback/WriteBackEngine.h"

static QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

// "from=to" pairs from --map, appended after the configured mappings
static QVector<PathMapping> collectMappings(const SyncSettings& settings, const QStringList& args)
{
    QVector<PathMapping> mappings = settings.pathMappings();
    for (const QString& arg : args) {
        int eq = arg.indexOf('=');
        if (eq <= 0) {
            qWarning() << "[CLI] Ignoring malformed --map" << arg;
            continue;
        }
        mappings.append({arg.left(eq), arg.mid(eq + 1)});
    }
    return mappings;
}

// ── Reporter for the synchronous sync command ───────────────────────
class ConsoleReporter : public IProgressReporter {
public:
    void log(LogLevel level, const QString& message, const QVariantMap&) override
    {
        if (level == LogLevel::Warning || level == LogLevel::Error)
            qWarning().noquote() << "[Sync]" << message;
        else
            qInfo().noquote() << "[Sync]" << message;
    }
    void updateProgress(int current, int total, const QString& message) override
    {
        out() << QStringLiteral("[%1%] %2").arg(progressPercent(current, total), 3).arg(message) << Qt::endl;
    }
    bool isCanceled() const override { return false; }
};

// ═══════════════════════════════════════════════════════════════════════
//  Commands
// ═══════════════════════════════════════════════════════════════════════

static int runValidate(const QString& exportPath, const QVector<PathMapping>& mappings)
{
    SyncError err;
    auto report = ImportValidator::validate(exportPath, mappings, &err);
    if (!report) {
        out() << "Validation failed: " << err.message << Qt::endl;
        return 1;
    }
    out() << "Total tracks:     " << report->totalTracks << Qt::endl
          << "Audiobook tracks: " << report->audiobookTracks << Qt::endl
          << "Files found:      " << report->filesFound << Qt::endl
          << "Files missing:    " << report->filesMissing << Qt::endl
          << "Estimated time:   " << report->estimatedTime << Qt::endl;
    for (const QString& p : report->missingPaths.mid(0, 20))
        out() << "  missing: " << p << Qt::endl;
    for (const QString& p : report->pathPrefixes)
        out() << "  prefix:  " << p << Qt::endl;
    return 0;
}

static int runJob(QCoreApplication& app, JobExecutor& executor, const QString& jobId,
                  const JobParams* params)
{
    JobQueue queue(&executor, 1);
    int exitCode = 1;

    QObject::connect(&queue, &JobQueue::jobProgress, &app,
                     [](const QString&, int current, int total, const QString& message) {
        out() << QStringLiteral("[%1%] %2").arg(progressPercent(current, total), 3).arg(message) << Qt::endl;
    });
    QObject::connect(&queue, &JobQueue::jobFinished, &app,
                     [&app, &exitCode](const QString& id, bool succeeded, const QString& summary) {
        out() << id << ": " << summary << Qt::endl;
        exitCode = succeeded ? 0 : 1;
        app.quit();
    });

    if (params) {
        if (queue.enqueueImport(*params, jobId).isEmpty())
            return 1;
    } else if (!queue.enqueueResume(jobId)) {
        return 1;
    }
    app.exec();
    queue.waitForDone();
    return exitCode;
}

// Queues the export's organized books for a debounced write-back and waits
// for the batch to land.
static int runAutoWriteBack(QCoreApplication& app, CatalogDatabase& db, const SyncSettings& settings,
                            const QString& exportPath, const QVector<PathMapping>& mappings)
{
    const QString source = QFileInfo(exportPath).absoluteFilePath();
    const QVector<CatalogBook> books = db.booksByImportSource(source, LibraryState::Organized);
    if (books.isEmpty())
        return 0;

    WriteBackEngine engine(&db);
    WriteBackBatcher batcher(&engine);
    batcher.setExportPath(source);
    batcher.setPathMappings(mappings);
    batcher.setDelay(settings.writeBackDelayMs());
    batcher.setEnabled(true);

    int exitCode = 1;
    QObject::connect(&batcher, &WriteBackBatcher::batchWritten, &app,
                     [&app, &exitCode](bool success, int, const QString& message) {
        out() << "Write-back: " << message << Qt::endl;
        exitCode = success ? 0 : 1;
        app.quit();
    });

    for (const auto& book : books)
        batcher.enqueue(book.id);
    qInfo() << "[WriteBack] Queued" << batcher.pendingCount() << "organized books";
    app.exec();
    return exitCode;
}

static int runSync(ImportPipeline& pipeline, CatalogDatabase& db, const QString& exportPath,
                   const QVector<PathMapping>& mappings, bool force)
{
    SyncReconciler reconciler(&db, &pipeline);
    SyncOptions options;
    options.exportPath = exportPath;
    options.pathMappings = mappings;
    options.force = force;

    ConsoleReporter reporter;
    SyncError err;
    auto result = reconciler.sync(options, &reporter, &err);
    if (!result) {
        out() << "Sync failed: " << err.message << Qt::endl;
        return 1;
    }
    out() << result->summary() << Qt::endl;
    return 0;
}

// Re-syncs whenever the export is rewritten, once it has been quiet for
// the write-back delay.
static int runWatch(QCoreApplication& app, ImportPipeline& pipeline, CatalogDatabase& db,
                    const SyncSettings& settings, const QString& exportPath,
                    const QVector<PathMapping>& mappings)
{
    ExportWatcher watcher;
    if (!watcher.watch(exportPath)) {
        out() << "Cannot watch " << exportPath << Qt::endl;
        return 1;
    }

    QTimer debounce;
    debounce.setSingleShot(true);
    debounce.setInterval(settings.writeBackDelayMs());
    QObject::connect(&watcher, &ExportWatcher::exportChanged, &debounce, [&debounce]() { debounce.start(); });
    QObject::connect(&debounce, &QTimer::timeout, &app, [&]() {
        watcher.clearChanged();
        if (runSync(pipeline, db, exportPath, mappings, false) != 0)
            qWarning() << "[Sync] Watch: sync failed, waiting for the next change";
    });

    if (runSync(pipeline, db, exportPath, mappings, false) != 0)
        return 1;
    out() << "Watching " << watcher.exportPath() << " (Ctrl+C to stop)" << Qt::endl;
    return app.exec();
}

static int runWriteBack(CatalogDatabase& db, const QCommandLineParser& parser, const QString& exportPath,
                        const QVector<PathMapping>& mappings)
{
    WriteBackEngine engine(&db);
    WriteBackOptions options;
    options.exportPath = exportPath;
    options.pathMappings = mappings;
    options.createBackup = !parser.isSet(QStringLiteral("no-backup"));
    options.forceOverwrite = parser.isSet(QStringLiteral("force"));
    options.backupPath = parser.value(QStringLiteral("backup"));
    options.updates = engine.updatesForBooks(parser.values(QStringLiteral("book")));
    for (const QString& arg : parser.values(QStringLiteral("update"))) {
        int eq = arg.indexOf('=');
        if (eq <= 0) {
            qWarning() << "[CLI] Ignoring malformed --update" << arg;
            continue;
        }
        options.updates.append({arg.left(eq), arg.mid(eq + 1)});
    }

    if (parser.isSet(QStringLiteral("dry-run"))) {
        const QStringList warnings = engine.validateWriteBack(options);
        for (const QString& w : warnings)
            out() << "warning: " << w << Qt::endl;
        out() << options.updates.size() << " updates, " << warnings.size() << " warnings" << Qt::endl;
        return warnings.isEmpty() ? 0 : 1;
    }

    WriteBackResult result = engine.writeBack(options);
    out() << result.message() << Qt::endl;
    if (result.conflict) {
        out() << "  stored:  " << result.conflict->stored.describe() << Qt::endl
              << "  current: " << result.conflict->current.describe() << Qt::endl
              << "Re-run with --force to overwrite." << Qt::endl;
    }
    return result.success ? 0 : 1;
}

// ═══════════════════════════════════════════════════════════════════════
//  main
// ═══════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("AudiobookSync");
    app.setApplicationName("audiobook-sync");
    app.setApplicationVersion(APP_VERSION);

    qInstallMessageHandler([](QtMsgType, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        QString line = QStringLiteral("[%1] %2\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
        fprintf(stderr, "%s", line.toUtf8().constData());
    });

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Import, sync and write back an iTunes library export."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("validate | import | resume | sync | watch | write-back"));
    parser.addPositionalArgument(QStringLiteral("export"),
                                 QStringLiteral("Path to the iTunes Library.xml export"));
    parser.addOptions({
        {QStringLiteral("settings"), QStringLiteral("Settings INI file."), QStringLiteral("file")},
        {QStringLiteral("db"), QStringLiteral("Catalog database (overrides settings)."), QStringLiteral("file")},
        {QStringLiteral("map"), QStringLiteral("Path mapping from=to on raw locations."), QStringLiteral("mapping")},
        {QStringLiteral("job"), QStringLiteral("Job id (import, resume)."), QStringLiteral("id")},
        {QStringLiteral("mode"), QStringLiteral("Import mode: organized, import, organize."), QStringLiteral("mode"),
         QStringLiteral("import")},
        {QStringLiteral("no-dedup"), QStringLiteral("Import duplicates by path or hash.")},
        {QStringLiteral("enrich"), QStringLiteral("Run metadata enrichment after import.")},
        {QStringLiteral("organize"), QStringLiteral("Organize imported books into the root directory.")},
        {QStringLiteral("preserve-location"), QStringLiteral("Never move files.")},
        {QStringLiteral("playlists"), QStringLiteral("Report playlist tags.")},
        {QStringLiteral("force"), QStringLiteral("Sync: ignore fingerprint. Write-back: overwrite on conflict.")},
        {QStringLiteral("book"), QStringLiteral("Write-back: catalog book id."), QStringLiteral("id")},
        {QStringLiteral("update"), QStringLiteral("Write-back: persistentId=newPath."), QStringLiteral("pair")},
        {QStringLiteral("no-backup"), QStringLiteral("Write-back: skip the backup copy.")},
        {QStringLiteral("backup"), QStringLiteral("Write-back: backup file path."), QStringLiteral("file")},
        {QStringLiteral("dry-run"), QStringLiteral("Write-back: only report problems.")},
    });
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);

    const QString command = args.at(0);
    SyncSettings settings(parser.isSet(QStringLiteral("settings")) ? parser.value(QStringLiteral("settings"))
                                                                   : SyncSettings::defaultPath());
    QString exportPath = args.value(1, settings.libraryXmlPath());
    const QVector<PathMapping> mappings = collectMappings(settings, parser.values(QStringLiteral("map")));

    if (command == QStringLiteral("validate")) {
        if (exportPath.isEmpty())
            parser.showHelp(1);
        return runValidate(exportPath, mappings);
    }

    const QString dbPath = parser.isSet(QStringLiteral("db")) ? parser.value(QStringLiteral("db"))
                                                            : settings.databasePath();
    CatalogDatabase db(dbPath);
    SyncError dbErr;
    if (!db.open(&dbErr)) {
        out() << dbErr.message << Qt::endl;
        return 1;
    }

    const PipelineOptions options = settings.pipelineOptions();
    ContentHasher hasher;
    NullEnricher enricher;
    BookOrganizer organizer(settings.organizerOptions(), &db);
    CheckpointStore checkpoints(&db);
    ImportPipeline pipeline(&db, &checkpoints, &hasher, &enricher, &organizer, options);
    ImportStatusRegistry registry;
    JobExecutor executor(&db, &checkpoints, &pipeline, &registry, options);

    if (command == QStringLiteral("resume")) {
        QString jobId = parser.value(QStringLiteral("job"));
        if (jobId.isEmpty())
            jobId = args.value(1);
        if (jobId.isEmpty()) {
            out() << "resume needs --job <id>" << Qt::endl;
            return 1;
        }
        return runJob(app, executor, jobId, nullptr);
    }

    if (exportPath.isEmpty())
        parser.showHelp(1);

    if (command == QStringLiteral("import")) {
        JobParams params;
        params.exportPath = exportPath;
        params.importMode = importModeFromName(parser.value(QStringLiteral("mode")));
        params.pathMappings = mappings;
        params.skipDuplicates = !parser.isSet(QStringLiteral("no-dedup"));
        params.enrichMetadata = parser.isSet(QStringLiteral("enrich"));
        params.autoOrganize = parser.isSet(QStringLiteral("organize"));
        params.preserveLocation = parser.isSet(QStringLiteral("preserve-location"));
        params.importPlaylists = parser.isSet(QStringLiteral("playlists"));
        int rc = runJob(app, executor, parser.value(QStringLiteral("job")), &params);
        if (rc == 0 && params.shouldOrganize() && settings.autoWriteBack())
            rc = runAutoWriteBack(app, db, settings, exportPath, mappings);
        return rc;
    }
    if (command == QStringLiteral("sync"))
        return runSync(pipeline, db, exportPath, mappings, parser.isSet(QStringLiteral("force")));
    if (command == QStringLiteral("watch"))
        return runWatch(app, pipeline, db, settings, exportPath, mappings);
    if (command == QStringLiteral("write-back"))
        return runWriteBack(db, parser, exportPath, mappings);

    out() << "Unknown command: " << command << Qt::endl;
    parser.showHelp(1);
}
