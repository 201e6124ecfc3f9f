#include "ContentHasher.h"

#include <QCryptographicHash>
#include <QFile>

std::optional<QString> ContentHasher::computeFileHash(const QString& path, SyncError* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("cannot read %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        setError(error, SyncError::Kind::IO, QStringLiteral("read error while hashing %1").arg(path));
        return std::nullopt;
    }
    return QString::fromLatin1(hash.result().toHex());
}
