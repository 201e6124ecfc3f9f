#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <optional>

// ── Library lifecycle ───────────────────────────────────────────────
enum class LibraryState {
    Imported,
    Organized,
    Deleted
};

QString libraryStateToString(LibraryState state);
std::optional<LibraryState> libraryStateFromString(const QString& str);

// ── Data Structs ────────────────────────────────────────────────────
struct CatalogBook {
    QString id;
    QString title;
    QString filePath;          // file; multi-track books: their own folder, else the first track
    QString originalFilename;
    QString format;            // lower-case extension, e.g. "m4b"
    int     duration = 0;      // seconds
    qint64  fileSize = 0;      // bytes, summed over segments
    int     releaseYear = 0;
    QString narrator;
    QString edition;
    QString description;
    QString authorId;
    QString seriesId;

    QString fileHash;
    QString originalFileHash;
    QString organizedFileHash;

    LibraryState libraryState = LibraryState::Imported;

    // Mirrors of the export entry
    QString   persistentId;
    int       playCount = 0;
    int       rating = 0;
    qint64    bookmark = 0;    // milliseconds
    QDateTime lastPlayed;
    QDateTime dateAdded;
    QString   importSource;    // export path this book came from

    QDateTime createdAt;
    QDateTime updatedAt;
};

struct BookSegment {
    QString id;
    QString bookId;
    QString filePath;
    QString format;
    qint64  fileSize = 0;
    int     duration = 0;      // seconds
    QString persistentId;      // export entry this file came from
    int     trackNumber = 0;
    int     totalTracks = 0;
};

struct Author {
    QString id;
    QString name;
};

struct Series {
    QString id;
    QString name;
    QString authorId;
};
