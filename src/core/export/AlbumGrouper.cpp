#include "AlbumGrouper.h"
#include "ExportParser.h"

#include <QHash>
#include <algorithm>

QString AlbumGrouper::groupKey(const ExportTrack& track)
{
    const QString artist = track.artist.trimmed();
    QString album = track.album.trimmed();
    if (album.isEmpty())
        album = track.name.trimmed();
    return artist + QLatin1Char('|') + album;
}

QVector<AlbumGroup> AlbumGrouper::group(const QVector<ExportTrack>& tracks)
{
    QVector<AlbumGroup> groups;
    QHash<QString, int> indexByKey;

    for (const auto& track : tracks) {
        if (!ExportParser::isLongFormAudio(track))
            continue;

        const QString key = groupKey(track);
        auto it = indexByKey.constFind(key);
        if (it == indexByKey.constEnd()) {
            indexByKey.insert(key, groups.size());
            AlbumGroup g;
            g.key = key;
            g.tracks.append(track);
            groups.append(g);
        } else {
            groups[it.value()].tracks.append(track);
        }
    }

    for (auto& g : groups) {
        std::stable_sort(g.tracks.begin(), g.tracks.end(),
                         [](const ExportTrack& a, const ExportTrack& b) {
            if (a.discNumber != b.discNumber)
                return a.discNumber < b.discNumber;
            return a.trackNumber < b.trackNumber;
        });
    }

    return groups;
}
