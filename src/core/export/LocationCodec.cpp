#include "LocationCodec.h"

#include <QRegularExpression>
#include <QSet>
#include <QUrl>

static const QString kLocalhostPrefix = QStringLiteral("file://localhost");
static const QString kFilePrefix = QStringLiteral("file://");

static bool isHexDigit(QChar c)
{
    const char16_t u = c.unicode();
    return (u >= u'0' && u <= u'9') || (u >= u'a' && u <= u'f') || (u >= u'A' && u <= u'F');
}

QString LocationCodec::normalizeSeparators(const QString& s)
{
    QString out = s;
    out.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return out;
}

// ═══════════════════════════════════════════════════════════════════════
//  decode / encode
// ═══════════════════════════════════════════════════════════════════════

std::optional<QString> LocationCodec::decode(const QString& rawLocation, SyncError* error)
{
    if (rawLocation.isEmpty()) {
        setError(error, SyncError::Kind::Decode, QStringLiteral("location is empty"));
        return std::nullopt;
    }

    QString loc = rawLocation;
    if (loc.startsWith(kLocalhostPrefix))
        loc.remove(0, kLocalhostPrefix.size());
    else if (loc.startsWith(kFilePrefix))
        loc.remove(0, kFilePrefix.size());
    else if (loc.contains(QLatin1String("://"))) {
        setError(error, SyncError::Kind::Decode,
                 QStringLiteral("not a file location: %1").arg(rawLocation));
        return std::nullopt;
    }

    // Reject broken escapes instead of passing them through.
    for (int i = 0; i < loc.size(); ++i) {
        if (loc.at(i) != QLatin1Char('%'))
            continue;
        if (i + 2 >= loc.size()
            || !isHexDigit(loc.at(i + 1))
            || !isHexDigit(loc.at(i + 2))) {
            setError(error, SyncError::Kind::Decode,
                     QStringLiteral("invalid percent-encoding in location: %1").arg(rawLocation));
            return std::nullopt;
        }
        i += 2;
    }

    QString decoded = QUrl::fromPercentEncoding(loc.toUtf8());

    // Drive-letter paths come through as /C:/...
    static const QRegularExpression driveRe(QStringLiteral("^/[A-Za-z]:/"));
    if (driveRe.match(decoded).hasMatch())
        decoded.remove(0, 1);

    if (decoded.isEmpty()) {
        setError(error, SyncError::Kind::Decode,
                 QStringLiteral("location has no path: %1").arg(rawLocation));
        return std::nullopt;
    }
    return decoded;
}

QString LocationCodec::encode(const QString& path)
{
    QString p = normalizeSeparators(path);
    if (!p.startsWith(QLatin1Char('/')))
        p.prepend(QLatin1Char('/'));

    const QByteArray encoded = QUrl::toPercentEncoding(p, QByteArrayLiteral("/:@!$'()*+,;=~"));
    return kLocalhostPrefix + QString::fromLatin1(encoded);
}

// ═══════════════════════════════════════════════════════════════════════
//  remap
// ═══════════════════════════════════════════════════════════════════════

QString LocationCodec::remap(const QString& rawLocation, const QVector<PathMapping>& mappings)
{
    if (mappings.isEmpty())
        return rawLocation;

    const QString normalized = normalizeSeparators(rawLocation);

    const PathMapping* best = nullptr;
    int bestLen = -1;
    for (const auto& m : mappings) {
        const QString from = normalizeSeparators(m.from);
        const QString to = normalizeSeparators(m.to);
        if (from.isEmpty() || to.isEmpty())
            continue;
        // Already remapped
        if (normalized.startsWith(to))
            return rawLocation;
        if (normalized.startsWith(from) && from.size() > bestLen) {
            best = &m;
            bestLen = from.size();
        }
    }

    if (!best)
        return rawLocation;
    return normalizeSeparators(best->to) + normalized.mid(bestLen);
}

QString LocationCodec::reverseRemap(const QString& localPath, const QVector<PathMapping>& mappings)
{
    const QString encoded = encode(localPath);
    if (mappings.isEmpty())
        return encoded;

    QVector<PathMapping> reversed;
    reversed.reserve(mappings.size());
    for (const auto& m : mappings)
        reversed.append(PathMapping{m.to, m.from});
    return remap(encoded, reversed);
}

std::optional<QString> LocationCodec::resolve(const QString& rawLocation,
                                              const QVector<PathMapping>& mappings,
                                              SyncError* error)
{
    return decode(remap(rawLocation, mappings), error);
}

// ═══════════════════════════════════════════════════════════════════════
//  extractPathPrefixes
// ═══════════════════════════════════════════════════════════════════════

QStringList LocationCodec::extractPathPrefixes(const QStringList& rawLocations)
{
    static const QString kRoot = QStringLiteral("file://localhost/");
    QSet<QString> seen;
    QStringList prefixes;

    for (const QString& loc : rawLocations) {
        if (!loc.startsWith(kFilePrefix))
            continue;
        QString after = loc;
        if (after.startsWith(kRoot))
            after.remove(0, kRoot.size());
        else
            after.remove(0, kFilePrefix.size());

        QStringList parts = after.split(QLatin1Char('/'));
        // Keep drive/root + two directories; the remainder is per-book.
        if (parts.size() > 3)
            parts = parts.mid(0, 3);
        else if (parts.size() > 1)
            parts.removeLast();   // drop the file name
        const QString prefix = kRoot + parts.join(QLatin1Char('/'));

        if (!seen.contains(prefix)) {
            seen.insert(prefix);
            prefixes.append(prefix);
        }
    }
    return prefixes;
}
