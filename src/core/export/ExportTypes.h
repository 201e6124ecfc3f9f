#pragma once

#include <QString>
#include <QVector>
#include <QDateTime>

// ── Export Track ────────────────────────────────────────────────────
// One entry of the media player's track list. Missing keys keep the
// zero values below.
struct ExportTrack {
    int     trackId = 0;
    QString persistentId;
    QString name;
    QString artist;
    QString albumArtist;
    QString album;
    QString genre;
    QString kind;
    int     discNumber = 0;
    int     trackNumber = 0;
    qint64  totalTime = 0;     // milliseconds
    qint64  size = 0;          // bytes
    QString location;          // raw file:// URL as exported
    int     year = 0;
    int     playCount = 0;
    int     rating = 0;        // 0-100
    qint64  bookmark = 0;      // milliseconds
    bool    bookmarkable = false;
    qint64  playDate = 0;      // seconds since epoch
    QDateTime playDateUtc;
    QDateTime dateAdded;
    QString comments;
};

struct ExportPlaylist {
    int          playlistId = 0;
    QString      name;
    QVector<int> trackIds;
};

// Parsed export. Tracks keep document order.
struct ExportLibrary {
    int     majorVersion = 0;
    int     minorVersion = 0;
    QString applicationVersion;
    QString musicFolder;
    QVector<ExportTrack>    tracks;
    QVector<ExportPlaylist> playlists;
};

// ── Path mapping ────────────────────────────────────────────────────
// Prefix substitution applied to raw (still encoded) locations, e.g.
//   from: file://localhost/W:/itunes/iTunes%20Media
//   to:   file://localhost/mnt/books/itunes/iTunes%20Media
struct PathMapping {
    QString from;
    QString to;

    bool operator==(const PathMapping& o) const { return from == o.from && to == o.to; }
};
