#pragma once

#include <QString>
#include <QVector>

#include "ExportTypes.h"

// Tracks that form one logical book. tracks[0] is authoritative for
// book-level fields (title, year, persistent id).
struct AlbumGroup {
    QString key;                  // "artist|album"
    QVector<ExportTrack> tracks;  // sorted by (disc, track), stable

    const ExportTrack& first() const { return tracks.first(); }
    bool isMultiTrack() const { return tracks.size() > 1; }
};

class AlbumGrouper {
public:
    // Filters to long-form audio, groups by trimmed (artist, album) with the
    // track name standing in for an empty album. Groups come out in
    // first-seen order.
    static QVector<AlbumGroup> group(const QVector<ExportTrack>& tracks);

    static QString groupKey(const ExportTrack& track);
};
