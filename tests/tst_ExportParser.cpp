#include <QtTest/QtTest>
#include <QTemporaryDir>
#include "export/ExportParser.h"
#include "export/LocationCodec.h"
#include "TestSupport.h"

class tst_ExportParser : public QObject {
    Q_OBJECT

private slots:

    // ── Document structure ───────────────────────────────────────
    void parse_readsHeaderAndTracksInDocumentOrder()
    {
        FixtureTrack a;
        a.id = 300;
        a.name = QStringLiteral("Third Id First");
        FixtureTrack b;
        b.id = 100;
        b.name = QStringLiteral("Lowest Id");
        FixtureTrack c;
        c.id = 200;
        c.name = QStringLiteral("Middle");

        SyncError err;
        auto lib = ExportParser::parse(buildExport({a, b, c}), &err);
        QVERIFY2(lib.has_value(), qPrintable(err.message));
        QCOMPARE(lib->majorVersion, 1);
        QCOMPARE(lib->minorVersion, 1);
        QCOMPARE(lib->applicationVersion, QStringLiteral("12.9.5.5"));
        QCOMPARE(lib->musicFolder, QStringLiteral("file://localhost/W:/itunes/iTunes%20Media/"));
        QCOMPARE(lib->tracks.size(), 3);
        QCOMPARE(lib->tracks[0].trackId, 300);
        QCOMPARE(lib->tracks[1].trackId, 100);
        QCOMPARE(lib->tracks[2].trackId, 200);
    }

    void parse_mapsTrackFields()
    {
        FixtureTrack t;
        t.id = 42;
        t.persistentId = QStringLiteral("ABCDEF0123456789");
        t.name = QStringLiteral("Chapter & Verse");
        t.artist = QStringLiteral("Jane Doe");
        t.albumArtist = QStringLiteral("John Reader");
        t.album = QStringLiteral("Saga, Book 1");
        t.disc = 1;
        t.track = 3;
        t.totalTime = 5400000;
        t.size = QStringLiteral("123456");
        t.year = 2019;
        t.playCount = 4;
        t.rating = 80;
        t.bookmark = 61000;
        t.playDateUtc = QStringLiteral("2024-01-15T10:30:00Z");
        t.comments = QStringLiteral("Unabridged");
        t.location = QStringLiteral("file://localhost/Users/a/My%20Book.m4b");

        auto lib = ExportParser::parse(buildExport({t}));
        QVERIFY(lib.has_value());
        const ExportTrack& tr = lib->tracks.first();
        QCOMPARE(tr.trackId, 42);
        QCOMPARE(tr.persistentId, QStringLiteral("ABCDEF0123456789"));
        QCOMPARE(tr.name, QStringLiteral("Chapter & Verse"));
        QCOMPARE(tr.artist, QStringLiteral("Jane Doe"));
        QCOMPARE(tr.albumArtist, QStringLiteral("John Reader"));
        QCOMPARE(tr.album, QStringLiteral("Saga, Book 1"));
        QCOMPARE(tr.genre, QStringLiteral("Audiobook"));
        QCOMPARE(tr.discNumber, 1);
        QCOMPARE(tr.trackNumber, 3);
        QCOMPARE(tr.totalTime, qint64(5400000));
        QCOMPARE(tr.size, qint64(123456));
        QCOMPARE(tr.year, 2019);
        QCOMPARE(tr.playCount, 4);
        QCOMPARE(tr.rating, 80);
        QCOMPARE(tr.bookmark, qint64(61000));
        QVERIFY(tr.bookmarkable);
        QCOMPARE(tr.playDateUtc, QDateTime(QDate(2024, 1, 15), QTime(10, 30), Qt::UTC));
        QVERIFY(tr.dateAdded.isValid());
        QCOMPARE(tr.comments, QStringLiteral("Unabridged"));
        QCOMPARE(tr.location, QStringLiteral("file://localhost/Users/a/My%20Book.m4b"));
    }

    void parse_missingKeysStayZero()
    {
        FixtureTrack t;
        t.id = 7;
        t.name = QStringLiteral("Bare");
        t.totalTime = 0;

        auto lib = ExportParser::parse(buildExport({t}));
        QVERIFY(lib.has_value());
        const ExportTrack& tr = lib->tracks.first();
        QVERIFY(tr.persistentId.isEmpty());
        QVERIFY(tr.location.isEmpty());
        QCOMPARE(tr.totalTime, qint64(0));
        QCOMPARE(tr.playCount, 0);
        QVERIFY(!tr.playDateUtc.isValid());
        QVERIFY(!tr.bookmarkable);
    }

    void parse_wrappedUnsignedSizeBecomesZero()
    {
        FixtureTrack t;
        t.id = 1;
        t.name = QStringLiteral("Huge");
        t.size = QStringLiteral("18446744073709551615");

        auto lib = ExportParser::parse(buildExport({t}));
        QVERIFY(lib.has_value());
        QCOMPARE(lib->tracks.first().size, qint64(0));
    }

    void parse_playlistsWithoutItemsAreDropped()
    {
        FixtureTrack t;
        t.id = 5;
        t.name = QStringLiteral("Listed");

        auto lib = ExportParser::parse(buildExport({t}, {
            {1, QStringLiteral("Library"), {5}},
            {2, QStringLiteral("Empty"), {}},
            {3, QStringLiteral("Road Trip"), {5}},
        }));
        QVERIFY(lib.has_value());
        QCOMPARE(lib->playlists.size(), 2);
        QCOMPARE(lib->playlists[0].name, QStringLiteral("Library"));
        QCOMPARE(lib->playlists[1].name, QStringLiteral("Road Trip"));
        QCOMPARE(lib->playlists[1].trackIds, QVector<int>{5});
    }

    // ── Failures ─────────────────────────────────────────────────
    void parse_truncatedDocumentFails()
    {
        const QByteArray xml = "<?xml version=\"1.0\"?><plist version=\"1.0\"><dict>"
                               "<key>Tracks</key><dict><key>1</key><dict><key>Name</key>";
        SyncError err;
        QVERIFY(!ExportParser::parse(xml, &err).has_value());
        QCOMPARE(err.kind, SyncError::Kind::Parse);
    }

    void parse_nonPlistFails()
    {
        SyncError err;
        QVERIFY(!ExportParser::parse("<html><body/></html>", &err).has_value());
        QCOMPARE(err.kind, SyncError::Kind::Parse);
        QVERIFY(err.message.contains(QStringLiteral("property list")));
    }

    void parseFile_missingFileFails()
    {
        QTemporaryDir dir;
        SyncError err;
        QVERIFY(!ExportParser::parseFile(dir.filePath(QStringLiteral("nope.xml")), &err).has_value());
        QCOMPARE(err.kind, SyncError::Kind::Parse);
    }

    void parseFile_readsFromDisk()
    {
        QTemporaryDir dir;
        const QString path = dir.filePath(QStringLiteral("Library.xml"));
        FixtureTrack t;
        t.id = 9;
        t.name = QStringLiteral("On Disk");
        QVERIFY(writeFile(path, buildExport({t})));

        auto lib = ExportParser::parseFile(path);
        QVERIFY(lib.has_value());
        QCOMPARE(lib->tracks.size(), 1);
    }

    // ── Classification ───────────────────────────────────────────
    void isLongFormAudio_data()
    {
        QTest::addColumn<QString>("kind");
        QTest::addColumn<QString>("genre");
        QTest::addColumn<QString>("location");
        QTest::addColumn<bool>("expected");

        QTest::newRow("kind audiobook") << "Protected AudioBook file" << "Fiction" << "" << true;
        QTest::newRow("kind spoken word") << "Spoken Word" << "" << "" << true;
        QTest::newRow("genre audiobooks") << "MPEG audio file" << "Audiobooks" << "" << true;
        QTest::newRow("genre spoken") << "MPEG audio file" << "Spoken & Audio" << "" << true;
        QTest::newRow("location") << "MPEG audio file" << "Fiction"
                                  << "file://localhost/W:/iTunes%20Media/Audiobooks/x.mp3" << true;
        QTest::newRow("music") << "MPEG audio file" << "Rock"
                               << "file://localhost/W:/iTunes%20Media/Music/x.mp3" << false;
    }

    void isLongFormAudio()
    {
        QFETCH(QString, kind);
        QFETCH(QString, genre);
        QFETCH(QString, location);
        QFETCH(bool, expected);

        ExportTrack t;
        t.kind = kind;
        t.genre = genre;
        t.location = location;
        QCOMPARE(ExportParser::isLongFormAudio(t), expected);
    }

    void playlistTags_skipBuiltInAndLowercase()
    {
        QVector<ExportPlaylist> playlists = {
            {1, QStringLiteral("Audiobooks"), {10, 11}},
            {2, QStringLiteral("Road Trip"), {10}},
            {3, QStringLiteral("Sci-Fi Favorites"), {10, 12}},
            {4, QStringLiteral("Other"), {12}},
        };
        QCOMPARE(ExportParser::playlistTags(10, playlists),
                 (QStringList{QStringLiteral("road trip"), QStringLiteral("sci-fi favorites")}));
        QVERIFY(ExportParser::playlistTags(11, playlists).isEmpty());
    }

    // ── LocationCodec: decode / encode ───────────────────────────
    void decode_stripsPrefixAndPercentEncoding()
    {
        QCOMPARE(LocationCodec::decode(QStringLiteral("file://localhost/Users/a/My%20Book.m4b")).value_or(QString()),
                 QStringLiteral("/Users/a/My Book.m4b"));
        QCOMPARE(LocationCodec::decode(QStringLiteral("file:///Users/a/b.mp3")).value_or(QString()),
                 QStringLiteral("/Users/a/b.mp3"));
        QCOMPARE(LocationCodec::decode(QStringLiteral("file://localhost/C:/Books/x.mp3")).value_or(QString()),
                 QStringLiteral("C:/Books/x.mp3"));
        QCOMPARE(LocationCodec::decode(QStringLiteral("file://localhost/m/%C3%BCber.mp3")).value_or(QString()),
                 QStringLiteral("/m/\u00FCber.mp3"));
    }

    void decode_rejectsBadInput_data()
    {
        QTest::addColumn<QString>("raw");
        QTest::newRow("empty") << QString();
        QTest::newRow("http") << QStringLiteral("http://example.com/a.mp3");
        QTest::newRow("bad escape") << QStringLiteral("file://localhost/bad%zzname.mp3");
        QTest::newRow("truncated escape") << QStringLiteral("file://localhost/bad%2");
        QTest::newRow("latin-1 after percent") << QStringLiteral("file://localhost/bad%\u00E91.mp3");
        QTest::newRow("fullwidth digits") << QStringLiteral("file://localhost/bad%\uFF11\uFF12.mp3");
    }

    void decode_rejectsBadInput()
    {
        QFETCH(QString, raw);
        SyncError err;
        QVERIFY(!LocationCodec::decode(raw, &err).has_value());
        QCOMPARE(err.kind, SyncError::Kind::Decode);
    }

    void encode_isInverseOfDecode()
    {
        const QString path = QStringLiteral("/Users/a/My Book (Part 1) \u00FCber.m4b");
        const QString raw = LocationCodec::encode(path);
        QVERIFY(raw.startsWith(QStringLiteral("file://localhost/Users/a/My%20Book%20(Part%201)%20")));
        QCOMPARE(LocationCodec::decode(raw).value_or(QString()), path);

        QCOMPARE(LocationCodec::encode(QStringLiteral("C:/Books/x.mp3")),
                 QStringLiteral("file://localhost/C:/Books/x.mp3"));
    }

    // ── LocationCodec: mappings ──────────────────────────────────
    void remap_replacesPrefixAndIsIdempotent()
    {
        const QVector<PathMapping> mappings = {
            {QStringLiteral("file://localhost/W:/itunes"), QStringLiteral("file://localhost/mnt/books/itunes")},
        };
        const QString raw = QStringLiteral("file://localhost/W:/itunes/Book/a%20b.mp3");
        const QString once = LocationCodec::remap(raw, mappings);
        QCOMPARE(once, QStringLiteral("file://localhost/mnt/books/itunes/Book/a%20b.mp3"));
        QCOMPARE(LocationCodec::remap(once, mappings), once);
        QCOMPARE(LocationCodec::resolve(raw, mappings).value_or(QString()),
                 QStringLiteral("/mnt/books/itunes/Book/a b.mp3"));
    }

    void remap_longestPrefixWins()
    {
        const QVector<PathMapping> mappings = {
            {QStringLiteral("file://localhost/W:"), QStringLiteral("file://localhost/short")},
            {QStringLiteral("file://localhost/W:/itunes/Audio"), QStringLiteral("file://localhost/long")},
        };
        QCOMPARE(LocationCodec::remap(QStringLiteral("file://localhost/W:/itunes/Audio/z.mp3"), mappings),
                 QStringLiteral("file://localhost/long/z.mp3"));
        QCOMPARE(LocationCodec::remap(QStringLiteral("file://localhost/W:/other/z.mp3"), mappings),
                 QStringLiteral("file://localhost/short/other/z.mp3"));
    }

    void remap_noMatchOrNoMappingsUnchanged()
    {
        const QString raw = QStringLiteral("file://localhost/Users/a/b.mp3");
        QCOMPARE(LocationCodec::remap(raw, {}), raw);
        QCOMPARE(LocationCodec::remap(raw, {{QStringLiteral("file://localhost/W:"),
                                             QStringLiteral("file://localhost/mnt")}}), raw);
    }

    void reverseRemap_restoresExporterNamespace()
    {
        const QVector<PathMapping> mappings = {
            {QStringLiteral("file://localhost/W:/itunes"), QStringLiteral("file://localhost/mnt/books/itunes")},
        };
        QCOMPARE(LocationCodec::reverseRemap(QStringLiteral("/mnt/books/itunes/Book/a b.mp3"), mappings),
                 QStringLiteral("file://localhost/W:/itunes/Book/a%20b.mp3"));
        QCOMPARE(LocationCodec::reverseRemap(QStringLiteral("/srv/a.mp3"), {}),
                 QStringLiteral("file://localhost/srv/a.mp3"));
    }

    void extractPathPrefixes_distinctThreeLevels()
    {
        const QStringList prefixes = LocationCodec::extractPathPrefixes({
            QStringLiteral("file://localhost/W:/itunes/iTunes%20Media/Audiobooks/A/x.mp3"),
            QStringLiteral("file://localhost/W:/itunes/iTunes%20Media/Audiobooks/B/y.mp3"),
            QStringLiteral("http://example.com/stream.mp3"),
            QStringLiteral("file://localhost/Users/bob/z.m4b"),
        });
        QCOMPARE(prefixes, (QStringList{
            QStringLiteral("file://localhost/W:/itunes/iTunes%20Media"),
            QStringLiteral("file://localhost/Users/bob"),
        }));
    }
};

QTEST_MAIN(tst_ExportParser)
#include "tst_ExportParser.moc"
