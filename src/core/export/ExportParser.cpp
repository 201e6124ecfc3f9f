#include "ExportParser.h"

#include <QFile>
#include <QXmlStreamReader>
#include <QDateTime>
#include <QDebug>
#include <QElapsedTimer>

// ═══════════════════════════════════════════════════════════════════════
//  parseFile / parse
// ═══════════════════════════════════════════════════════════════════════

std::optional<ExportLibrary> ExportParser::parseFile(const QString& path, SyncError* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("failed to open export file %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }
    const QByteArray data = file.readAll();
    file.close();

    QElapsedTimer t; t.start();
    auto library = parse(data, error);
    if (library)
        qDebug() << "[Export] Parsed" << library->tracks.size() << "tracks,"
                 << library->playlists.size() << "playlists from" << path
                 << "in" << t.elapsed() << "ms";
    return library;
}

std::optional<ExportLibrary> ExportParser::parse(const QByteArray& data, SyncError* error)
{
    QXmlStreamReader xml(data);

    if (!xml.readNextStartElement() || xml.name() != QLatin1String("plist")) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("export is not a property list (line %1)").arg(xml.lineNumber()));
        return std::nullopt;
    }
    if (!xml.readNextStartElement() || xml.name() != QLatin1String("dict")) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("export root is not a dict (line %1)").arg(xml.lineNumber()));
        return std::nullopt;
    }

    ExportLibrary library;
    QString key;

    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("key")) {
            key = xml.readElementText();
            continue;
        }

        if (key == QLatin1String("Tracks") && xml.name() == QLatin1String("dict")) {
            if (!readTracks(xml, library.tracks))
                break;
        } else if (key == QLatin1String("Playlists") && xml.name() == QLatin1String("array")) {
            const QVariantList items = readArray(xml);
            for (const QVariant& item : items) {
                ExportPlaylist p = playlistFromDict(item.toMap());
                if (!p.trackIds.isEmpty())
                    library.playlists.append(p);
            }
        } else {
            const QVariant value = readValue(xml);
            if (key == QLatin1String("Major Version"))
                library.majorVersion = value.toInt();
            else if (key == QLatin1String("Minor Version"))
                library.minorVersion = value.toInt();
            else if (key == QLatin1String("Application Version"))
                library.applicationVersion = value.toString();
            else if (key == QLatin1String("Music Folder"))
                library.musicFolder = value.toString();
        }
        key.clear();
    }

    if (xml.hasError()) {
        setError(error, SyncError::Kind::Parse,
                 QStringLiteral("malformed export at line %1, column %2: %3")
                     .arg(xml.lineNumber()).arg(xml.columnNumber()).arg(xml.errorString()));
        return std::nullopt;
    }

    return library;
}

// ═══════════════════════════════════════════════════════════════════════
//  Property-list value readers
// ═══════════════════════════════════════════════════════════════════════

// Called with the reader on a value's StartElement; leaves it on the
// matching EndElement.
QVariant ExportParser::readValue(QXmlStreamReader& xml)
{
    const auto name = xml.name();

    if (name == QLatin1String("dict"))
        return readDict(xml);
    if (name == QLatin1String("array"))
        return readArray(xml);
    if (name == QLatin1String("true")) {
        xml.skipCurrentElement();
        return true;
    }
    if (name == QLatin1String("false")) {
        xml.skipCurrentElement();
        return false;
    }

    const QString text = xml.readElementText().trimmed();
    if (name == QLatin1String("integer")) {
        bool ok = false;
        qint64 v = text.toLongLong(&ok);
        if (!ok) {
            // The exporter writes some sizes as unsigned 64-bit values.
            quint64 u = text.toULongLong(&ok);
            v = ok ? static_cast<qint64>(u) : 0;
        }
        return v;
    }
    if (name == QLatin1String("real"))
        return text.toDouble();
    if (name == QLatin1String("date"))
        return QDateTime::fromString(text, Qt::ISODate);
    if (name == QLatin1String("data"))
        return QByteArray::fromBase64(text.toLatin1());
    return text;
}

QVariantMap ExportParser::readDict(QXmlStreamReader& xml)
{
    QVariantMap dict;
    QString key;
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("key")) {
            key = xml.readElementText();
        } else {
            dict.insert(key, readValue(xml));
            key.clear();
        }
    }
    return dict;
}

QVariantList ExportParser::readArray(QXmlStreamReader& xml)
{
    QVariantList list;
    while (xml.readNextStartElement())
        list.append(readValue(xml));
    return list;
}

// Tracks is a dict of "<id>" → track dict; read it by hand so document
// order survives (QVariantMap would sort by key).
bool ExportParser::readTracks(QXmlStreamReader& xml, QVector<ExportTrack>& out)
{
    while (xml.readNextStartElement()) {
        if (xml.name() == QLatin1String("key")) {
            xml.readElementText();
            continue;
        }
        if (xml.name() != QLatin1String("dict")) {
            xml.raiseError(QStringLiteral("unexpected <%1> inside Tracks").arg(xml.name().toString()));
            return false;
        }
        out.append(trackFromDict(readDict(xml)));
    }
    return !xml.hasError();
}

// ═══════════════════════════════════════════════════════════════════════
//  Field mapping
// ═══════════════════════════════════════════════════════════════════════

ExportTrack ExportParser::trackFromDict(const QVariantMap& d)
{
    ExportTrack t;
    t.trackId      = d.value(QStringLiteral("Track ID")).toInt();
    t.persistentId = d.value(QStringLiteral("Persistent ID")).toString();
    t.name         = d.value(QStringLiteral("Name")).toString();
    t.artist       = d.value(QStringLiteral("Artist")).toString();
    t.albumArtist  = d.value(QStringLiteral("Album Artist")).toString();
    t.album        = d.value(QStringLiteral("Album")).toString();
    t.genre        = d.value(QStringLiteral("Genre")).toString();
    t.kind         = d.value(QStringLiteral("Kind")).toString();
    t.discNumber   = d.value(QStringLiteral("Disc Number")).toInt();
    t.trackNumber  = d.value(QStringLiteral("Track Number")).toInt();
    t.totalTime    = d.value(QStringLiteral("Total Time")).toLongLong();
    t.location     = d.value(QStringLiteral("Location")).toString();
    t.year         = d.value(QStringLiteral("Year")).toInt();
    t.playCount    = d.value(QStringLiteral("Play Count")).toInt();
    t.rating       = d.value(QStringLiteral("Rating")).toInt();
    t.bookmark     = d.value(QStringLiteral("Bookmark")).toLongLong();
    t.bookmarkable = d.value(QStringLiteral("Bookmarkable")).toBool();
    t.playDate     = d.value(QStringLiteral("Play Date")).toLongLong();
    t.playDateUtc  = d.value(QStringLiteral("Play Date UTC")).toDateTime();
    t.dateAdded    = d.value(QStringLiteral("Date Added")).toDateTime();
    t.comments     = d.value(QStringLiteral("Comments")).toString();

    // Unsigned sizes wrap negative; 0 makes the importer stat the file instead.
    t.size = d.value(QStringLiteral("Size")).toLongLong();
    if (t.size < 0)
        t.size = 0;

    return t;
}

ExportPlaylist ExportParser::playlistFromDict(const QVariantMap& d)
{
    ExportPlaylist p;
    p.playlistId = d.value(QStringLiteral("Playlist ID")).toInt();
    p.name = d.value(QStringLiteral("Name")).toString();
    const QVariantList items = d.value(QStringLiteral("Playlist Items")).toList();
    p.trackIds.reserve(items.size());
    for (const QVariant& item : items)
        p.trackIds.append(item.toMap().value(QStringLiteral("Track ID")).toInt());
    return p;
}

// ═══════════════════════════════════════════════════════════════════════
//  Classification
// ═══════════════════════════════════════════════════════════════════════

bool ExportParser::isLongFormAudio(const ExportTrack& track)
{
    const QString kind = track.kind.toLower();
    if (kind.contains(QLatin1String("audiobook")) || kind.contains(QLatin1String("spoken word")))
        return true;

    const QString genre = track.genre.toLower();
    if (genre.contains(QLatin1String("audiobook")) || genre.contains(QLatin1String("spoken")))
        return true;

    return track.location.contains(QLatin1String("Audiobooks"))
        || track.location.contains(QLatin1String("audiobooks"));
}

bool ExportParser::isBuiltInPlaylist(const QString& name)
{
    static const QStringList kBuiltIn = {
        QStringLiteral("Music"), QStringLiteral("Movies"), QStringLiteral("TV Shows"),
        QStringLiteral("Podcasts"), QStringLiteral("Audiobooks"), QStringLiteral("iTunes U"),
        QStringLiteral("Books"), QStringLiteral("Genius"), QStringLiteral("Recently Added"),
        QStringLiteral("Recently Played"), QStringLiteral("Top 25 Most Played"),
        QStringLiteral("Library")
    };
    return kBuiltIn.contains(name);
}

QStringList ExportParser::playlistTags(int trackId, const QVector<ExportPlaylist>& playlists)
{
    QStringList tags;
    for (const auto& p : playlists) {
        if (isBuiltInPlaylist(p.name))
            continue;
        if (p.trackIds.contains(trackId))
            tags.append(p.name.toLower());
    }
    return tags;
}
