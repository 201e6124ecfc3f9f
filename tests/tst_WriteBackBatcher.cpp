#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include "catalog/CatalogDatabase.h"
#include "export/ExportParser.h"
#include "writeback/WriteBackBatcher.h"
#include "writeback/WriteBackEngine.h"
#include "TestSupport.h"

class tst_WriteBackBatcher : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    CatalogDatabase* m_db = nullptr;
    WriteBackEngine* m_engine = nullptr;
    WriteBackBatcher* m_batcher = nullptr;
    QString m_exportPath;
    QStringList m_bookIds;

private slots:
    void init()
    {
        m_dir = new QTemporaryDir;
        QVERIFY(m_dir->isValid());
        m_exportPath = m_dir->filePath(QStringLiteral("Library.xml"));
        m_db = new CatalogDatabase(m_dir->filePath(QStringLiteral("catalog.db")));
        SyncError err;
        QVERIFY2(m_db->open(&err), qPrintable(err.message));
        m_engine = new WriteBackEngine(m_db);
        m_batcher = new WriteBackBatcher(m_engine);
        m_batcher->setExportPath(m_exportPath);
        m_batcher->setDelay(20);
        m_batcher->setEnabled(true);

        QVector<FixtureTrack> tracks;
        m_bookIds.clear();
        for (int i = 1; i <= 2; ++i) {
            FixtureTrack t;
            t.id = i;
            t.persistentId = QStringLiteral("PID-%1").arg(i);
            t.name = QStringLiteral("Book %1").arg(i);
            t.location = locationOf(makeAudioFile(m_dir->filePath(QStringLiteral("media")),
                                                  QStringLiteral("Book %1.m4b").arg(i)));
            tracks.append(t);

            CatalogBook book;
            book.title = t.name;
            book.persistentId = t.persistentId;
            book.filePath = m_dir->filePath(QStringLiteral("organized/Book %1.m4b").arg(i));
            auto created = m_db->createBook(book);
            QVERIFY(created.has_value());
            m_bookIds.append(created->id);
        }
        QVERIFY(writeFile(m_exportPath, buildExport(tracks)));
    }

    void cleanup()
    {
        delete m_batcher;
        delete m_engine;
        m_db->close();
        delete m_db;
        delete m_dir;
        m_batcher = nullptr;
        m_engine = nullptr;
        m_db = nullptr;
        m_dir = nullptr;
    }

    // ── Debounce ─────────────────────────────────────────────────
    void enqueue_writesOneBatchAfterQuietPeriod()
    {
        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_batcher->enqueue(m_bookIds[0]);
        m_batcher->enqueue(m_bookIds[1]);
        m_batcher->enqueue(m_bookIds[0]);
        QCOMPARE(m_batcher->pendingCount(), 2);

        QVERIFY(spy.wait(5000));
        QCOMPARE(spy.count(), 1);
        const QList<QVariant> args = spy.takeFirst();
        QCOMPARE(args.at(0).toBool(), true);
        QCOMPARE(args.at(1).toInt(), 2);
        QCOMPARE(m_batcher->pendingCount(), 0);

        auto library = ExportParser::parseFile(m_exportPath);
        QVERIFY(library.has_value());
        for (const auto& t : library->tracks)
            QVERIFY(t.location.contains(QStringLiteral("/organized/")));
    }

    void enqueue_noBackupForBatches()
    {
        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_batcher->enqueue(m_bookIds[0]);
        QVERIFY(spy.wait(5000));
        const QStringList files = QDir(m_dir->path()).entryList({QStringLiteral("Library.xml.backup.*")});
        QVERIFY(files.isEmpty());
    }

    void enqueue_ignoredWhenDisabled()
    {
        m_batcher->setEnabled(false);
        QVERIFY(!m_batcher->isEnabled());
        m_batcher->enqueue(m_bookIds[0]);
        QCOMPARE(m_batcher->pendingCount(), 0);
    }

    void setEnabled_falseDropsPending()
    {
        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_batcher->enqueue(m_bookIds[0]);
        m_batcher->setEnabled(false);
        QCOMPARE(m_batcher->pendingCount(), 0);
        QTest::qWait(100);
        QCOMPARE(spy.count(), 0);
    }

    // ── flush ────────────────────────────────────────────────────
    void flush_withoutExportPathFails()
    {
        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_batcher->setExportPath(QString());
        m_batcher->enqueue(m_bookIds[0]);
        m_batcher->flush();

        QCOMPARE(spy.count(), 1);
        const QList<QVariant> args = spy.takeFirst();
        QCOMPARE(args.at(0).toBool(), false);
        QCOMPARE(args.at(1).toInt(), 0);
        QCOMPARE(args.at(2).toString(), QStringLiteral("no export path configured"));
    }

    void flush_booksWithoutPersistentIdWriteNothing()
    {
        CatalogBook local;
        local.title = QStringLiteral("Local");
        local.filePath = m_dir->filePath(QStringLiteral("local.m4b"));
        auto created = m_db->createBook(local);
        QVERIFY(created.has_value());
        const QByteArray before = readFile(m_exportPath);

        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_batcher->enqueue(created->id);
        m_batcher->flush();

        QCOMPARE(spy.count(), 1);
        const QList<QVariant> args = spy.takeFirst();
        QCOMPARE(args.at(0).toBool(), true);
        QCOMPARE(args.at(1).toInt(), 0);
        QCOMPARE(args.at(2).toString(), QStringLiteral("nothing to write"));
        QCOMPARE(readFile(m_exportPath), before);
    }

    void flush_emptyQueueIsSilent()
    {
        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_batcher->flush();
        QCOMPARE(spy.count(), 0);
    }

    void flush_reportsEngineFailure()
    {
        QSignalSpy spy(m_batcher, &WriteBackBatcher::batchWritten);
        m_engine->setValidator([](const QString&, SyncError* error) {
            setError(error, SyncError::Kind::Parse, QStringLiteral("rejected"));
            return false;
        });
        m_batcher->enqueue(m_bookIds[1]);
        m_batcher->flush();

        QCOMPARE(spy.count(), 1);
        const QList<QVariant> args = spy.takeFirst();
        QCOMPARE(args.at(0).toBool(), false);
        QVERIFY(args.at(2).toString().contains(QStringLiteral("rejected")));
    }
};

QTEST_MAIN(tst_WriteBackBatcher)
#include "tst_WriteBackBatcher.moc"
