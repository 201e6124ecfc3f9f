#include <QtTest/QtTest>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include "catalog/CatalogDatabase.h"
#include "jobs/CheckpointStore.h"
#include "jobs/JobExecutor.h"
#include "pipeline/ContentHasher.h"
#include "pipeline/ImportPipeline.h"
#include "pipeline/SyncReconciler.h"
#include "TestSupport.h"

class tst_SyncReconciler : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    CatalogDatabase* m_db = nullptr;
    CheckpointStore* m_checkpoints = nullptr;
    ContentHasher m_hasher;
    ImportPipeline* m_pipeline = nullptr;
    SyncReconciler* m_sync = nullptr;
    QVector<FixtureTrack> m_tracks;
    QString m_exportPath;

    FixtureTrack& track(const QString& persistentId)
    {
        for (auto& t : m_tracks) {
            if (t.persistentId == persistentId)
                return t;
        }
        qFatal("no fixture track %s", qPrintable(persistentId));
        return m_tracks.first();
    }

    FixtureTrack makeTrack(int id, const QString& persistentId, const QString& name)
    {
        FixtureTrack t;
        t.id = id;
        t.persistentId = persistentId;
        t.name = name;
        t.artist = QStringLiteral("Author");
        t.location = locationOf(makeAudioFile(m_dir->filePath(QStringLiteral("media")),
                                              QStringLiteral("Author/%1.m4b").arg(name)));
        return t;
    }

    void writeExport()
    {
        QVERIFY(writeFile(m_exportPath, buildExport(m_tracks)));
    }

    // Imports the current export through a full job so a fingerprint is stored.
    void importAll()
    {
        ImportStatusRegistry registry;
        JobExecutor executor(m_db, m_checkpoints, m_pipeline, &registry);
        JobParams params;
        params.exportPath = m_exportPath;
        RecordingReporter reporter;
        QVERIFY(executor.run(QStringLiteral("seed"), params, &reporter).succeeded());
    }

    SyncOptions options(bool force = false) const
    {
        SyncOptions o;
        o.exportPath = m_exportPath;
        o.force = force;
        return o;
    }

private slots:
    void init()
    {
        m_dir = new QTemporaryDir;
        QVERIFY(m_dir->isValid());
        m_exportPath = m_dir->filePath(QStringLiteral("Library.xml"));
        m_db = new CatalogDatabase(m_dir->filePath(QStringLiteral("catalog.db")));
        SyncError err;
        QVERIFY2(m_db->open(&err), qPrintable(err.message));
        m_checkpoints = new CheckpointStore(m_db);
        m_pipeline = new ImportPipeline(m_db, m_checkpoints, &m_hasher, nullptr, nullptr);
        m_sync = new SyncReconciler(m_db, m_pipeline);

        m_tracks = {
            makeTrack(1, QStringLiteral("PID-A"), QStringLiteral("First Book")),
            makeTrack(2, QStringLiteral("PID-B"), QStringLiteral("Second Book")),
            makeTrack(3, QStringLiteral("PID-C"), QStringLiteral("Third Book")),
        };
        m_tracks[1].playCount = 2;
        writeExport();
        importAll();
        QCOMPARE(m_db->bookCount(), 3);
    }

    void cleanup()
    {
        delete m_sync;
        delete m_pipeline;
        delete m_checkpoints;
        m_db->close();
        delete m_db;
        delete m_dir;
        m_sync = nullptr;
        m_pipeline = nullptr;
        m_checkpoints = nullptr;
        m_db = nullptr;
        m_dir = nullptr;
    }

    // ── Fingerprint short-circuit ────────────────────────────────
    void sync_unchangedExportShortCircuits()
    {
        RecordingReporter reporter;
        auto result = m_sync->sync(options(), &reporter);
        QVERIFY(result.has_value());
        QVERIFY(result->exportUnchanged);
        QCOMPARE(result->total, 0);
        QCOMPARE(result->summary(), QStringLiteral("Export unchanged since last sync"));
        QVERIFY(reporter.hasLog(QStringLiteral("Export unchanged")));
    }

    void sync_forceIgnoresFingerprint()
    {
        auto result = m_sync->sync(options(true));
        QVERIFY(result.has_value());
        QVERIFY(!result->exportUnchanged);
        QCOMPARE(result->total, 3);
        QCOMPARE(result->unchanged, 3);
        QCOMPARE(result->updated, 0);
        QCOMPARE(result->summary(), QStringLiteral("Sync complete: 0 updated, 0 new, 3 unchanged"));
    }

    // ── Reconciliation ───────────────────────────────────────────
    void sync_mirrorsPlayStateChanges()
    {
        track(QStringLiteral("PID-B")).playCount = 12;
        track(QStringLiteral("PID-B")).rating = 80;
        track(QStringLiteral("PID-B")).bookmark = 65000;
        track(QStringLiteral("PID-C")).playDateUtc = QStringLiteral("2024-05-02T08:15:00Z");
        writeExport();

        auto result = m_sync->sync(options());
        QVERIFY(result.has_value());
        QVERIFY(!result->exportUnchanged);
        QCOMPARE(result->updated, 2);
        QCOMPARE(result->unchanged, 1);
        QCOMPARE(result->created, 0);

        auto b = m_db->bookByPersistentId(QStringLiteral("PID-B"));
        QCOMPARE(b->playCount, 12);
        QCOMPARE(b->rating, 80);
        QCOMPARE(b->bookmark, qint64(65000));
        auto c = m_db->bookByPersistentId(QStringLiteral("PID-C"));
        QCOMPARE(c->lastPlayed, QDateTime(QDate(2024, 5, 2), QTime(8, 15), Qt::UTC));
        QCOMPARE(m_db->bookCount(), 3);
    }

    void sync_importsUnknownPersistentIds()
    {
        m_tracks.append(makeTrack(4, QStringLiteral("PID-D"), QStringLiteral("Fourth Book")));
        writeExport();

        RecordingReporter reporter;
        auto result = m_sync->sync(options(), &reporter);
        QVERIFY(result.has_value());
        QCOMPARE(result->created, 1);
        QCOMPARE(result->unchanged, 3);
        QCOMPARE(m_db->bookCount(), 4);
        auto d = m_db->bookByPersistentId(QStringLiteral("PID-D"));
        QVERIFY(d.has_value());
        QCOMPARE(d->title, QStringLiteral("Fourth Book"));
        QCOMPARE(d->importSource, QFileInfo(m_exportPath).absoluteFilePath());
        QVERIFY(reporter.hasLog(QStringLiteral("Imported new audiobook 'Fourth Book'")));
    }

    void sync_newEntryWithMissingFileFails()
    {
        FixtureTrack ghost = makeTrack(5, QStringLiteral("PID-GHOST"), QStringLiteral("Ghost"));
        QVERIFY(QFile::remove(LocationCodec::decode(ghost.location).value()));
        m_tracks.append(ghost);
        writeExport();

        auto result = m_sync->sync(options());
        QVERIFY(result.has_value());
        QCOMPARE(result->failed, 1);
        QCOMPARE(result->errors.size(), 1);
        QVERIFY(result->errors.first().contains(QStringLiteral("file does not exist")));
        QVERIFY(result->summary().endsWith(QStringLiteral("1 failed")));
    }

    void sync_skipsEntriesWithoutPersistentId()
    {
        FixtureTrack anon = makeTrack(6, QString(), QStringLiteral("Anonymous"));
        m_tracks.append(anon);
        writeExport();

        auto result = m_sync->sync(options());
        QVERIFY(result.has_value());
        QCOMPARE(result->skipped, 1);
        QCOMPARE(result->created, 0);
        QCOMPARE(m_db->bookCount(), 3);
    }

    void sync_savesFingerprintAfterRun()
    {
        track(QStringLiteral("PID-A")).playCount = 7;
        writeExport();
        QVERIFY(m_sync->sync(options()).has_value());

        auto second = m_sync->sync(options());
        QVERIFY(second.has_value());
        QVERIFY(second->exportUnchanged);
    }

    void sync_canceledRunKeepsOldFingerprint()
    {
        track(QStringLiteral("PID-A")).playCount = 7;
        writeExport();

        RecordingReporter reporter;
        reporter.canceled = true;
        auto result = m_sync->sync(options(), &reporter);
        QVERIFY(result.has_value());
        QVERIFY(result->canceled);
        QCOMPARE(result->updated, 0);

        auto again = m_sync->sync(options());
        QVERIFY(!again->exportUnchanged);
        QCOMPARE(again->updated, 1);
    }

    void sync_updateFailuresRespectErrorLimit()
    {
        for (auto& t : m_tracks)
            t.playCount += 5;
        writeExport();

        // A second connection installs a trigger that rejects every book update
        {
            QSqlDatabase side = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), QStringLiteral("reject_updates"));
            side.setDatabaseName(m_dir->filePath(QStringLiteral("catalog.db")));
            QVERIFY(side.open());
            QSqlQuery q(side);
            QVERIFY(q.exec(QStringLiteral("CREATE TRIGGER reject_updates BEFORE UPDATE ON books "
                                          "BEGIN SELECT RAISE(ABORT, 'catalog is read-only'); END")));
            q.finish();
            side.close();
        }
        QSqlDatabase::removeDatabase(QStringLiteral("reject_updates"));

        PipelineOptions limited;
        limited.errorLimit = 1;
        ImportPipeline pipeline(m_db, m_checkpoints, &m_hasher, nullptr, nullptr, limited);
        SyncReconciler reconciler(m_db, &pipeline);
        RecordingReporter reporter;
        auto result = reconciler.sync(options(), &reporter);
        QVERIFY(result.has_value());
        QCOMPARE(result->failed, 3);
        QCOMPARE(result->updated, 0);
        QCOMPARE(result->errors.size(), 1);
        QVERIFY(result->errors.first().startsWith(QStringLiteral("Failed to update")));
        QVERIFY(reporter.hasLog(QStringLiteral("Failed to update 'Third Book'")));
    }

    // ── Fatal errors ─────────────────────────────────────────────
    void sync_missingExportIsIoError()
    {
        SyncOptions o;
        o.exportPath = m_dir->filePath(QStringLiteral("gone.xml"));
        SyncError err;
        QVERIFY(!m_sync->sync(o, nullptr, &err).has_value());
        QCOMPARE(err.kind, SyncError::Kind::IO);
    }

    void sync_malformedExportIsParseError()
    {
        QVERIFY(writeFile(m_exportPath, "<plist version=\"1.0\"><dict><key>Tracks</key>"));
        SyncError err;
        QVERIFY(!m_sync->sync(options(), nullptr, &err).has_value());
        QCOMPARE(err.kind, SyncError::Kind::Parse);
    }

    // ── applyPlayState ───────────────────────────────────────────
    void applyPlayState_reportsChange()
    {
        CatalogBook book;
        ExportTrack t;
        QVERIFY(!SyncReconciler::applyPlayState(book, t));

        t.playCount = 3;
        t.rating = 60;
        QVERIFY(SyncReconciler::applyPlayState(book, t));
        QCOMPARE(book.playCount, 3);
        QCOMPARE(book.rating, 60);
        QVERIFY(!SyncReconciler::applyPlayState(book, t));
    }

    void applyPlayState_lastPlayedAtSecondPrecision()
    {
        CatalogBook book;
        book.lastPlayed = QDateTime::fromMSecsSinceEpoch(1700000000250, Qt::UTC);
        ExportTrack t;
        t.playDateUtc = QDateTime::fromSecsSinceEpoch(1700000000, Qt::UTC);
        QVERIFY(!SyncReconciler::applyPlayState(book, t));

        t.playDateUtc = QDateTime();
        t.playDate = 1700000100;
        QVERIFY(SyncReconciler::applyPlayState(book, t));
        QCOMPARE(book.lastPlayed.toSecsSinceEpoch(), qint64(1700000100));
    }
};

QTEST_MAIN(tst_SyncReconciler)
#include "tst_SyncReconciler.moc"
