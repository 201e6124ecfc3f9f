#include "ImportValidator.h"
#include "../export/ExportParser.h"
#include "../export/LocationCodec.h"

#include <QFileInfo>
#include <QtConcurrent>
#include <QDebug>

namespace {

struct TrackCheck {
    QString rawLocation;
    QString path;       // empty when the location did not decode
    bool found = false;
};

} // namespace

std::optional<ValidationReport> ImportValidator::validate(const QString& exportPath,
                                                          const QVector<PathMapping>& mappings,
                                                          SyncError* error)
{
    auto library = ExportParser::parseFile(exportPath, error);
    if (!library)
        return std::nullopt;

    ValidationReport report;
    report.totalTracks = library->tracks.size();

    // Pass 1: filter and decode (cheap, sequential)
    QVector<TrackCheck> checks;
    QStringList rawLocations;
    for (const auto& track : library->tracks) {
        if (!ExportParser::isLongFormAudio(track))
            continue;
        ++report.audiobookTracks;
        rawLocations.append(track.location);

        TrackCheck tc;
        tc.rawLocation = track.location;
        tc.path = LocationCodec::resolve(track.location, mappings).value_or(QString());
        checks.append(tc);
    }

    qDebug() << "[Import] Validate:" << report.audiobookTracks << "of" << report.totalTracks
             << "tracks are audiobooks, checking files...";

    // Pass 2: stat in parallel on the global pool
    const QVector<TrackCheck> results = QtConcurrent::blockingMapped(checks, [](const TrackCheck& tc) {
        TrackCheck r = tc;
        r.found = !tc.path.isEmpty() && QFileInfo::exists(tc.path);
        return r;
    });

    for (const auto& r : results) {
        if (r.found) {
            ++report.filesFound;
        } else {
            ++report.filesMissing;
            report.missingPaths.append(r.path.isEmpty() ? r.rawLocation : r.path);
        }
    }

    report.pathPrefixes = LocationCodec::extractPathPrefixes(rawLocations);
    report.estimatedTime = formatEstimate(report.filesFound);
    return report;
}

QString ImportValidator::formatEstimate(int seconds)
{
    if (seconds < 60)
        return QStringLiteral("%1 seconds").arg(seconds);
    if (seconds < 3600)
        return QStringLiteral("%1 minutes").arg(seconds / 60);
    return QStringLiteral("%1 hours %2 minutes").arg(seconds / 3600).arg((seconds % 3600) / 60);
}
