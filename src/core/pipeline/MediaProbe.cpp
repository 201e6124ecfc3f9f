#include "MediaProbe.h"

#include <QFile>
#include <QDebug>

#include <taglib/fileref.h>
#include <taglib/audioproperties.h>

std::optional<qint64> MediaProbe::durationMs(const QString& filePath)
{
    TagLib::FileRef f(QFile::encodeName(filePath).constData(), true,
                      TagLib::AudioProperties::Fast);
    if (f.isNull() || !f.audioProperties()) {
        qDebug() << "[Import] No audio properties for" << filePath;
        return std::nullopt;
    }
    int ms = f.audioProperties()->lengthInMilliseconds();
    if (ms <= 0)
        return std::nullopt;
    return static_cast<qint64>(ms);
}
