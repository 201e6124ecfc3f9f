#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <optional>

#include "ExportTypes.h"
#include "../SyncError.h"

// Converts between exported file:// locations and local paths.
// Remapping works on the raw (still encoded) location.
class LocationCodec {
public:
    // file://localhost/Users/a/My%20Book.m4b → /Users/a/My Book.m4b
    static std::optional<QString> decode(const QString& rawLocation, SyncError* error = nullptr);

    // Inverse of decode: /Users/a/My Book.m4b → file://localhost/Users/a/My%20Book.m4b
    static QString encode(const QString& path);

    // Longest matching `from` prefix wins. A location that already starts
    // with one of the `to` prefixes is returned unchanged, so remapping is
    // idempotent.
    static QString remap(const QString& rawLocation, const QVector<PathMapping>& mappings);

    // Local path → location in the exporting machine's namespace (to → from).
    static QString reverseRemap(const QString& localPath, const QVector<PathMapping>& mappings);

    // remap then decode.
    static std::optional<QString> resolve(const QString& rawLocation,
                                          const QVector<PathMapping>& mappings,
                                          SyncError* error = nullptr);

    // Distinct file://localhost/<a>/<b>/<c> prefixes, for mapping suggestions.
    static QStringList extractPathPrefixes(const QStringList& rawLocations);

private:
    static QString normalizeSeparators(const QString& s);
};
