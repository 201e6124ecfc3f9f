#include <QtTest/QtTest>
#include <QSignalSpy>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include "catalog/CatalogDatabase.h"

static CatalogBook makeBook(const QString& title, const QString& path,
                            const QString& persistentId = QString())
{
    CatalogBook b;
    b.title = title;
    b.filePath = path;
    b.originalFilename = QFileInfo(path).fileName();
    b.format = QFileInfo(path).suffix();
    b.duration = 3600;
    b.fileSize = 1024;
    b.persistentId = persistentId;
    b.importSource = QStringLiteral("/exports/Library.xml");
    return b;
}

class tst_CatalogDatabase : public QObject {
    Q_OBJECT

private:
    QTemporaryDir* m_dir = nullptr;
    CatalogDatabase* m_db = nullptr;

private slots:
    void init()
    {
        m_dir = new QTemporaryDir;
        QVERIFY(m_dir->isValid());
        m_db = new CatalogDatabase(m_dir->filePath(QStringLiteral("catalog.db")));
        SyncError err;
        QVERIFY2(m_db->open(&err), qPrintable(err.message));
    }

    void cleanup()
    {
        m_db->close();
        delete m_db;
        m_db = nullptr;
        delete m_dir;
        m_dir = nullptr;
    }

    // ── Books ────────────────────────────────────────────────────
    void createBook_assignsIdAndRoundTrips()
    {
        CatalogBook b = makeBook(QStringLiteral("Dune"), QStringLiteral("/books/dune.m4b"), QStringLiteral("PID1"));
        b.narrator = QStringLiteral("Scott Brick");
        b.edition = QStringLiteral("Unabridged");
        b.fileHash = QStringLiteral("hash-1");
        b.originalFileHash = QStringLiteral("hash-1");
        b.libraryState = LibraryState::Organized;
        b.playCount = 3;
        b.rating = 60;
        b.bookmark = 120000;
        b.lastPlayed = QDateTime(QDate(2024, 5, 1), QTime(8, 15, 30), Qt::UTC);

        SyncError err;
        auto created = m_db->createBook(b, &err);
        QVERIFY2(created.has_value(), qPrintable(err.message));
        QVERIFY(!created->id.isEmpty());

        auto loaded = m_db->bookById(created->id);
        QVERIFY(loaded.has_value());
        QCOMPARE(loaded->title, QStringLiteral("Dune"));
        QCOMPARE(loaded->filePath, QStringLiteral("/books/dune.m4b"));
        QCOMPARE(loaded->format, QStringLiteral("m4b"));
        QCOMPARE(loaded->duration, 3600);
        QCOMPARE(loaded->narrator, QStringLiteral("Scott Brick"));
        QCOMPARE(loaded->edition, QStringLiteral("Unabridged"));
        QCOMPARE(loaded->libraryState, LibraryState::Organized);
        QCOMPARE(loaded->persistentId, QStringLiteral("PID1"));
        QCOMPARE(loaded->playCount, 3);
        QCOMPARE(loaded->rating, 60);
        QCOMPARE(loaded->bookmark, qint64(120000));
        QCOMPARE(loaded->lastPlayed, b.lastPlayed);
        QVERIFY(!loaded->dateAdded.isValid());
        QCOMPARE(loaded->importSource, QStringLiteral("/exports/Library.xml"));
        QVERIFY(loaded->createdAt.isValid());
        QCOMPARE(m_db->bookCount(), 1);
    }

    void lookups_byPathHashAndPersistentId()
    {
        CatalogBook b = makeBook(QStringLiteral("Emma"), QStringLiteral("/books/emma.mp3"), QStringLiteral("PID2"));
        b.fileHash = QStringLiteral("hash-emma");
        auto created = m_db->createBook(b);
        QVERIFY(created.has_value());

        QCOMPARE(m_db->bookByFilePath(QStringLiteral("/books/emma.mp3"))->id, created->id);
        QCOMPARE(m_db->bookByFileHash(QStringLiteral("hash-emma"))->id, created->id);
        QCOMPARE(m_db->bookByPersistentId(QStringLiteral("PID2"))->id, created->id);

        QVERIFY(!m_db->bookByFilePath(QStringLiteral("/books/other.mp3")).has_value());
        QVERIFY(!m_db->bookByPersistentId(QString()).has_value());
        QVERIFY(!m_db->bookById(QStringLiteral("missing")).has_value());
    }

    void updateBook_changesFieldsAndSignals()
    {
        auto created = m_db->createBook(makeBook(QStringLiteral("Old"), QStringLiteral("/books/a.mp3")));
        QVERIFY(created.has_value());

        QSignalSpy spy(m_db, &CatalogDatabase::databaseChanged);
        CatalogBook b = *created;
        b.title = QStringLiteral("New");
        b.filePath = QStringLiteral("/organized/New.mp3");
        b.libraryState = LibraryState::Organized;
        QVERIFY(m_db->updateBook(b));
        QCOMPARE(spy.count(), 1);

        auto loaded = m_db->bookById(created->id);
        QCOMPARE(loaded->title, QStringLiteral("New"));
        QCOMPARE(loaded->filePath, QStringLiteral("/organized/New.mp3"));
        QCOMPARE(loaded->libraryState, LibraryState::Organized);
    }

    void updateBook_unknownIdIsNotFound()
    {
        CatalogBook b = makeBook(QStringLiteral("Ghost"), QStringLiteral("/books/ghost.mp3"));
        b.id = QStringLiteral("does-not-exist");
        SyncError err;
        QVERIFY(!m_db->updateBook(b, &err));
        QCOMPARE(err.kind, SyncError::Kind::NotFound);
    }

    void booksByImportSource_filtersByState()
    {
        CatalogBook a = makeBook(QStringLiteral("A"), QStringLiteral("/books/a.mp3"));
        CatalogBook b = makeBook(QStringLiteral("B"), QStringLiteral("/books/b.mp3"));
        b.libraryState = LibraryState::Organized;
        CatalogBook c = makeBook(QStringLiteral("C"), QStringLiteral("/books/c.mp3"));
        c.importSource = QStringLiteral("/exports/Other.xml");
        QVERIFY(m_db->createBook(a));
        QVERIFY(m_db->createBook(b));
        QVERIFY(m_db->createBook(c));

        const auto imported = m_db->booksByImportSource(QStringLiteral("/exports/Library.xml"), LibraryState::Imported);
        QCOMPARE(imported.size(), 1);
        QCOMPARE(imported.first().title, QStringLiteral("A"));
        QCOMPARE(m_db->booksByImportSource(QStringLiteral("/exports/Library.xml"), LibraryState::Organized).size(), 1);
    }

    // ── Segments ─────────────────────────────────────────────────
    void segments_orderedByTrackNumber()
    {
        auto book = m_db->createBook(makeBook(QStringLiteral("Saga"), QStringLiteral("/books/saga")));
        QVERIFY(book.has_value());

        for (int n : {2, 1, 3}) {
            BookSegment s;
            s.bookId = book->id;
            s.filePath = QStringLiteral("/books/saga/%1.mp3").arg(n);
            s.format = QStringLiteral("mp3");
            s.trackNumber = n;
            s.totalTracks = 3;
            s.duration = 600;
            QVERIFY(m_db->createSegment(s));
        }

        const QVector<BookSegment> segs = m_db->segmentsForBook(book->id);
        QCOMPARE(segs.size(), 3);
        QCOMPARE(segs[0].trackNumber, 1);
        QCOMPARE(segs[1].trackNumber, 2);
        QCOMPARE(segs[2].trackNumber, 3);
        QCOMPARE(segs[0].filePath, QStringLiteral("/books/saga/1.mp3"));
        QVERIFY(!segs[0].id.isEmpty());
    }

    void segments_persistentIdLookupAndUpdate()
    {
        auto book = m_db->createBook(makeBook(QStringLiteral("Saga"), QStringLiteral("/books/saga"), QStringLiteral("PID-S1")));
        QVERIFY(book.has_value());
        for (int n : {1, 2}) {
            BookSegment s;
            s.bookId = book->id;
            s.filePath = QStringLiteral("/books/saga/%1.mp3").arg(n);
            s.persistentId = QStringLiteral("PID-S%1").arg(n);
            s.trackNumber = n;
            QVERIFY(m_db->createSegment(s));
        }

        auto second = m_db->segmentByPersistentId(QStringLiteral("PID-S2"));
        QVERIFY(second.has_value());
        QCOMPARE(second->bookId, book->id);
        QCOMPARE(second->filePath, QStringLiteral("/books/saga/2.mp3"));
        QVERIFY(!m_db->segmentByPersistentId(QStringLiteral("PID-NONE")).has_value());
        QVERIFY(!m_db->segmentByPersistentId(QString()).has_value());

        QSignalSpy spy(m_db, &CatalogDatabase::databaseChanged);
        second->filePath = QStringLiteral("/library/Saga/2.mp3");
        QVERIFY(m_db->updateSegment(*second));
        QCOMPARE(spy.count(), 1);
        QCOMPARE(m_db->segmentsForBook(book->id)[1].filePath, QStringLiteral("/library/Saga/2.mp3"));

        BookSegment ghost = *second;
        ghost.id = QStringLiteral("no-such-segment");
        SyncError err;
        QVERIFY(!m_db->updateSegment(ghost, &err));
        QCOMPARE(err.kind, SyncError::Kind::NotFound);
    }

    void open_addsSegmentPersistentIdToOlderCatalog()
    {
        const QString path = m_dir->filePath(QStringLiteral("old.db"));
        {
            QSqlDatabase old = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), QStringLiteral("old_catalog"));
            old.setDatabaseName(path);
            QVERIFY(old.open());
            QSqlQuery q(old);
            QVERIFY(q.exec(QStringLiteral(
                "CREATE TABLE book_segments (id TEXT PRIMARY KEY, book_id TEXT NOT NULL, file_path TEXT,"
                " format TEXT, file_size INTEGER DEFAULT 0, duration INTEGER DEFAULT 0,"
                " track_number INTEGER DEFAULT 0, total_tracks INTEGER DEFAULT 0)")));
            q.finish();
            old.close();
        }
        QSqlDatabase::removeDatabase(QStringLiteral("old_catalog"));

        CatalogDatabase db(path);
        SyncError err;
        QVERIFY2(db.open(&err), qPrintable(err.message));
        auto book = db.createBook(makeBook(QStringLiteral("Old"), QStringLiteral("/books/old")));
        QVERIFY(book.has_value());
        BookSegment s;
        s.bookId = book->id;
        s.filePath = QStringLiteral("/books/old/1.mp3");
        s.persistentId = QStringLiteral("PID-OLD-1");
        QVERIFY(db.createSegment(s));
        QCOMPARE(db.segmentByPersistentId(QStringLiteral("PID-OLD-1"))->filePath, s.filePath);
        db.close();
    }

    // ── Authors / series ─────────────────────────────────────────
    void getOrCreateAuthor_isExactMatch()
    {
        auto a1 = m_db->getOrCreateAuthorByName(QStringLiteral("Ursula K. Le Guin"));
        auto a2 = m_db->getOrCreateAuthorByName(QStringLiteral("Ursula K. Le Guin"));
        auto a3 = m_db->getOrCreateAuthorByName(QStringLiteral("ursula k. le guin"));
        QVERIFY(a1 && a2 && a3);
        QCOMPARE(a1->id, a2->id);
        QVERIFY(a1->id != a3->id);
        QCOMPARE(m_db->authorById(a1->id)->name, QStringLiteral("Ursula K. Le Guin"));
        QVERIFY(!m_db->authorById(QStringLiteral("nope")).has_value());
    }

    void getOrCreateSeries_scopedByAuthor()
    {
        auto author = m_db->getOrCreateAuthorByName(QStringLiteral("Author"));
        QVERIFY(author.has_value());

        auto s1 = m_db->getOrCreateSeriesByName(QStringLiteral("Saga"), author->id);
        auto s2 = m_db->getOrCreateSeriesByName(QStringLiteral("Saga"), author->id);
        auto s3 = m_db->getOrCreateSeriesByName(QStringLiteral("Saga"), QString());
        QVERIFY(s1 && s2 && s3);
        QCOMPARE(s1->id, s2->id);
        QVERIFY(s1->id != s3->id);

        auto loaded = m_db->seriesById(s1->id);
        QVERIFY(loaded.has_value());
        QCOMPARE(loaded->name, QStringLiteral("Saga"));
        QCOMPARE(loaded->authorId, author->id);
    }

    void setBookAuthors_keepsOrderAndReplaces()
    {
        auto book = m_db->createBook(makeBook(QStringLiteral("Co-written"), QStringLiteral("/books/co.mp3")));
        auto a = m_db->getOrCreateAuthorByName(QStringLiteral("First"));
        auto b = m_db->getOrCreateAuthorByName(QStringLiteral("Second"));
        QVERIFY(book && a && b);

        QVERIFY(m_db->setBookAuthors(book->id, {b->id, a->id}));
        QCOMPARE(m_db->bookAuthors(book->id), (QStringList{b->id, a->id}));

        QVERIFY(m_db->setBookAuthors(book->id, {a->id}));
        QCOMPARE(m_db->bookAuthors(book->id), QStringList{a->id});
    }

    // ── Blocked hashes / fingerprints / operation rows ───────────
    void blockedHashes()
    {
        QVERIFY(!m_db->isHashBlocked(QStringLiteral("deadbeef")));
        QVERIFY(m_db->blockHash(QStringLiteral("deadbeef"), QStringLiteral("deleted by user")));
        QVERIFY(m_db->isHashBlocked(QStringLiteral("deadbeef")));
        QVERIFY(m_db->blockHash(QStringLiteral("deadbeef"), QStringLiteral("again")));
    }

    void libraryFingerprint_roundTrip()
    {
        LibraryFingerprint fp;
        fp.path = QStringLiteral("/exports/Library.xml");
        fp.size = 4096;
        fp.modTime = QDateTime::fromMSecsSinceEpoch(1700000000123, Qt::UTC);
        fp.checksum = QStringLiteral("0123456789abcdef");
        QVERIFY(m_db->saveLibraryFingerprint(fp));

        auto loaded = m_db->libraryFingerprint(fp.path);
        QVERIFY(loaded.has_value());
        QVERIFY(loaded->matches(fp, true));
        QCOMPARE(loaded->path, fp.path);
        QVERIFY(!m_db->libraryFingerprint(QStringLiteral("/exports/Other.xml")).has_value());

        fp.size = 8192;
        QVERIFY(m_db->saveLibraryFingerprint(fp));
        QCOMPARE(m_db->libraryFingerprint(fp.path)->size, qint64(8192));
    }

    void operationRows_saveLoadDelete()
    {
        QVERIFY(m_db->saveOperationParams(QStringLiteral("op"), "{\"a\":1}"));
        QVERIFY(m_db->saveOperationState(QStringLiteral("op"), "{\"b\":2}"));
        QCOMPARE(m_db->operationParams(QStringLiteral("op")), QByteArray("{\"a\":1}"));
        QCOMPARE(m_db->operationState(QStringLiteral("op")), QByteArray("{\"b\":2}"));

        QVERIFY(m_db->deleteOperationState(QStringLiteral("op")));
        QVERIFY(m_db->operationParams(QStringLiteral("op")).isEmpty());
        QVERIFY(m_db->operationState(QStringLiteral("op")).isEmpty());
    }

    // ── Connections ──────────────────────────────────────────────
    void secondInstance_seesCommittedRows()
    {
        auto created = m_db->createBook(makeBook(QStringLiteral("Shared"), QStringLiteral("/books/shared.mp3")));
        QVERIFY(created.has_value());

        CatalogDatabase other(m_db->path());
        QVERIFY(other.open());
        QCOMPARE(other.bookById(created->id)->title, QStringLiteral("Shared"));
        other.close();
        QVERIFY(m_db->isOpen());
    }

    void reopen_keepsData()
    {
        QVERIFY(m_db->createBook(makeBook(QStringLiteral("Persisted"), QStringLiteral("/books/p.mp3"))));
        m_db->close();
        QVERIFY(!m_db->isOpen());
        QVERIFY(m_db->open());
        QCOMPARE(m_db->bookCount(), 1);
    }
};

QTEST_MAIN(tst_CatalogDatabase)
#include "tst_CatalogDatabase.moc"
