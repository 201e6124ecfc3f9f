#include "LibraryFingerprint.h"

#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>

bool LibraryFingerprint::matches(const LibraryFingerprint& other, bool strong) const
{
    if (size != other.size)
        return false;
    if (modTime.toMSecsSinceEpoch() != other.modTime.toMSecsSinceEpoch())
        return false;
    return !strong || checksum == other.checksum;
}

QString LibraryFingerprint::describe() const
{
    return QStringLiteral("%1 bytes, modified %2, md5 %3")
        .arg(size)
        .arg(modTime.toString(Qt::ISODateWithMs))
        .arg(checksum.left(12));
}

QString FingerprintConflict::message() const
{
    return QStringLiteral("export has been modified externally (size: %1→%2, mtime: %3→%4)")
        .arg(stored.size)
        .arg(current.size)
        .arg(stored.modTime.toString(Qt::ISODate), current.modTime.toString(Qt::ISODate));
}

std::optional<LibraryFingerprint> FingerprintService::compute(const QString& path, SyncError* error)
{
    QFileInfo fi(path);
    if (!fi.exists() || !fi.isFile()) {
        setError(error, SyncError::Kind::IO, QStringLiteral("export file not found: %1").arg(path));
        return std::nullopt;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("failed to open %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    QCryptographicHash hash(QCryptographicHash::Md5);
    if (!hash.addData(&file)) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("failed to read %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    LibraryFingerprint fp;
    fp.path = fi.absoluteFilePath();
    fp.size = fi.size();
    fp.modTime = fi.lastModified();
    fp.checksum = QString::fromLatin1(hash.result().toHex());
    return fp;
}
