#pragma once

#include <QString>
#include <optional>

// Reads stream properties straight from an audio file.
class MediaProbe {
public:
    // Duration in milliseconds, or nullopt when TagLib cannot open the file.
    static std::optional<qint64> durationMs(const QString& filePath);
};
