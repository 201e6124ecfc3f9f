#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QVariant>
#include <optional>

#include "ExportTypes.h"
#include "../SyncError.h"

class QXmlStreamReader;

// Reads the media player's property-list XML export.
// A malformed document fails the whole parse (SyncError::Kind::Parse);
// a bad value inside one track only zeroes that field.
class ExportParser {
public:
    static std::optional<ExportLibrary> parseFile(const QString& path, SyncError* error = nullptr);
    static std::optional<ExportLibrary> parse(const QByteArray& data, SyncError* error = nullptr);

    // Long-form spoken audio heuristic (kind, genre, then location).
    static bool isLongFormAudio(const ExportTrack& track);

    // Lower-cased names of user playlists that contain trackId.
    static QStringList playlistTags(int trackId, const QVector<ExportPlaylist>& playlists);
    static bool isBuiltInPlaylist(const QString& name);

private:
    static QVariant readValue(QXmlStreamReader& xml);
    static QVariantMap readDict(QXmlStreamReader& xml);
    static QVariantList readArray(QXmlStreamReader& xml);
    static bool readTracks(QXmlStreamReader& xml, QVector<ExportTrack>& out);
    static ExportTrack trackFromDict(const QVariantMap& dict);
    static ExportPlaylist playlistFromDict(const QVariantMap& dict);
};
