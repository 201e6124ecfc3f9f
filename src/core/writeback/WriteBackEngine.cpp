#include "WriteBackEngine.h"
#include "../catalog/ICatalogStore.h"
#include "../export/ExportParser.h"
#include "../export/LocationCodec.h"

#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QDebug>

#include <algorithm>

QString WriteBackResult::message() const
{
    if (conflict)
        return conflict->message();
    if (!success)
        return error.message;
    QString msg = QStringLiteral("Updated %1 entries in export").arg(updatedCount);
    if (!unmatchedIds.isEmpty())
        msg += QStringLiteral(", %1 not found in export").arg(unmatchedIds.size());
    if (!backupPath.isEmpty())
        msg += QStringLiteral(" (backup: %1)").arg(backupPath);
    return msg;
}

WriteBackEngine::WriteBackEngine(ICatalogStore* store)
    : m_store(store)
    , m_validator([](const QString& path, SyncError* error) {
        return ExportParser::parseFile(path, error).has_value();
    })
{
}

QString WriteBackEngine::defaultBackupPath(const QString& exportPath)
{
    return exportPath + QStringLiteral(".backup.")
        + QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd-HHmmss"));
}

std::optional<QString> WriteBackEngine::pathForUpdate(const WriteBackUpdate& update) const
{
    // A track of a multi-track book is known through its segment; the
    // book itself only carries the first track's id.
    auto segment = m_store->segmentByPersistentId(update.persistentId);
    auto book = segment ? m_store->bookById(segment->bookId) : m_store->bookByPersistentId(update.persistentId);
    if (!segment && !book)
        return std::nullopt;
    if (!update.newPath.isEmpty())
        return update.newPath;
    return segment ? segment->filePath : book->filePath;
}

// ═══════════════════════════════════════════════════════════════════════
//  writeBack
// ═══════════════════════════════════════════════════════════════════════

WriteBackResult WriteBackEngine::writeBack(const WriteBackOptions& options)
{
    WriteBackResult result;
    const QString exportPath = QFileInfo(options.exportPath).absoluteFilePath();

    if (!QFileInfo(exportPath).isFile()) {
        result.error = SyncError::make(SyncError::Kind::IO,
                                       QStringLiteral("export file not found: %1").arg(exportPath));
        return result;
    }

    QHash<QString, QString> locations;
    for (const auto& update : options.updates) {
        if (update.persistentId.isEmpty())
            continue;
        auto path = pathForUpdate(update);
        if (!path) {
            qDebug() << "[WriteBack] No book carries persistent id" << update.persistentId;
            continue;
        }
        if (QFileInfo(*path).isDir()) {
            qWarning() << "[WriteBack] Skipping" << update.persistentId << ": location would be a directory" << *path;
            continue;
        }
        locations.insert(update.persistentId, LocationCodec::reverseRemap(*path, options.pathMappings));
    }
    if (locations.isEmpty()) {
        result.error = SyncError::make(SyncError::Kind::Validation, QStringLiteral("no valid updates to write"));
        return result;
    }

    // Someone else may have rewritten the export since our last sync
    const std::optional<LibraryFingerprint> stored = m_store->libraryFingerprint(exportPath);
    if (!options.forceOverwrite && stored) {
        auto current = FingerprintService::compute(exportPath, &result.error);
        if (!current)
            return result;
        if (!current->matches(*stored, true)) {
            result.conflict = FingerprintConflict{*stored, *current};
            result.error = SyncError::make(SyncError::Kind::Conflict, result.conflict->message());
            qWarning() << "[WriteBack]" << result.error.message;
            return result;
        }
    }

    QFile in(exportPath);
    if (!in.open(QIODevice::ReadOnly)) {
        result.error = SyncError::make(SyncError::Kind::IO,
                                       QStringLiteral("failed to read %1: %2").arg(exportPath, in.errorString()));
        return result;
    }
    const QByteArray original = in.readAll();
    const QDateTime originalModified = QFileInfo(exportPath).lastModified();
    in.close();

    int replaced = 0;
    QSet<QString> matched;
    const QByteArray rewritten = rewriteLocations(original, locations, &replaced, &matched);
    for (auto it = locations.constBegin(); it != locations.constEnd(); ++it) {
        if (!matched.contains(it.key()))
            result.unmatchedIds.append(it.key());
    }
    std::sort(result.unmatchedIds.begin(), result.unmatchedIds.end());
    for (const QString& id : result.unmatchedIds)
        qWarning() << "[WriteBack] Persistent id" << id << "not found in" << exportPath;

    if (replaced > 0) {
        if (options.createBackup) {
            QString backupPath = options.backupPath.isEmpty() ? defaultBackupPath(exportPath) : options.backupPath;
            if (QFile::exists(backupPath))
                QFile::remove(backupPath);
            if (!QFile::copy(exportPath, backupPath)) {
                result.error = SyncError::make(SyncError::Kind::IO,
                                               QStringLiteral("failed to create backup %1").arg(backupPath));
                return result;
            }
            result.backupPath = backupPath;
            qDebug() << "[WriteBack] Backup:" << backupPath;
        }

        if (!writeBytes(exportPath, rewritten, &result.error))
            return result;

        SyncError validationErr;
        if (!m_validator(exportPath, &validationErr)) {
            restoreOriginal(exportPath, original, originalModified);
            // Same bytes as when the fingerprint was taken: keep it current
            if (stored) {
                auto restored = FingerprintService::compute(exportPath);
                if (restored && restored->checksum == stored->checksum && !restored->matches(*stored, true))
                    m_store->saveLibraryFingerprint(*restored);
            }
            result.error = SyncError::make(
                SyncError::Kind::Validation,
                QStringLiteral("rewritten export failed validation, original restored: %1")
                    .arg(validationErr.message));
            qWarning() << "[WriteBack]" << result.error.message;
            return result;
        }
    }

    if (auto fp = FingerprintService::compute(exportPath))
        m_store->saveLibraryFingerprint(*fp);

    result.success = true;
    result.updatedCount = replaced;
    qInfo() << "[WriteBack]" << result.message();
    return result;
}

bool WriteBackEngine::writeBytes(const QString& path, const QByteArray& data, SyncError* error)
{
    QSaveFile out(path);
    if (!out.open(QIODevice::WriteOnly)) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("failed to open %1 for writing: %2").arg(path, out.errorString()));
        return false;
    }
    if (out.write(data) != data.size() || !out.commit()) {
        setError(error, SyncError::Kind::IO,
                 QStringLiteral("failed to write %1: %2").arg(path, out.errorString()));
        return false;
    }
    return true;
}

// Puts back the original bytes and modification time, so the file matches
// the fingerprint taken before the write.
void WriteBackEngine::restoreOriginal(const QString& path, const QByteArray& data, const QDateTime& modified)
{
    SyncError restoreErr;
    if (!writeBytes(path, data, &restoreErr)) {
        qCritical() << "[WriteBack] Restore of" << path << "failed:" << restoreErr.message;
        return;
    }
    QFile file(path);
    if (!file.open(QIODevice::ReadWrite) || !file.setFileTime(modified, QFileDevice::FileModificationTime))
        qWarning() << "[WriteBack] Could not restore modification time of" << path << ":" << file.errorString();
}

// ═══════════════════════════════════════════════════════════════════════
//  rewriteLocations
// ═══════════════════════════════════════════════════════════════════════

namespace {

// Finds the text of a <string> element that directly follows `from`
// (only whitespace in between) and closes before `limit`.
bool findStringValue(const QByteArray& xml, int from, int limit, int* start, int* end)
{
    static const QByteArray open("<string>");
    static const QByteArray close("</string>");

    int tag = xml.indexOf(open, from);
    if (tag < 0 || tag >= limit)
        return false;
    for (int i = from; i < tag; ++i) {
        const char c = xml.at(i);
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
            return false;
    }
    int s = tag + open.size();
    int e = xml.indexOf(close, s);
    if (e < 0 || e > limit)
        return false;
    *start = s;
    *end = e;
    return true;
}

struct Edit {
    int start;
    int end;
    QByteArray text;
};

} // namespace

QByteArray WriteBackEngine::rewriteLocations(const QByteArray& xml, const QHash<QString, QString>& locations,
                                             int* replaced, QSet<QString>* matched)
{
    static const QByteArray pidKey("<key>Persistent ID</key>");
    static const QByteArray locationKey("<key>Location</key>");

    // Track dicts hold no nested dicts, so the nearest <dict> / </dict>
    // around a key bound its entry.
    QVector<Edit> edits;
    int pos = 0;
    while ((pos = xml.indexOf(pidKey, pos)) >= 0) {
        const int keyEnd = pos + pidKey.size();
        const int dictStart = xml.lastIndexOf("<dict>", pos);
        const int dictEnd = xml.indexOf("</dict>", keyEnd);
        pos = keyEnd;
        if (dictStart < 0 || dictEnd < 0)
            continue;

        int vs = 0, ve = 0;
        if (!findStringValue(xml, keyEnd, dictEnd, &vs, &ve))
            continue;
        const QString pid = QString::fromUtf8(xml.mid(vs, ve - vs)).trimmed();
        auto it = locations.constFind(pid);
        if (it == locations.constEnd())
            continue;

        const int loc = xml.indexOf(locationKey, dictStart);
        if (loc < 0 || loc > dictEnd)
            continue;
        int ls = 0, le = 0;
        if (!findStringValue(xml, loc + locationKey.size(), dictEnd, &ls, &le))
            continue;
        edits.append({ls, le, it.value().toHtmlEscaped().toUtf8()});
        if (matched)
            matched->insert(pid);
    }

    std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.start < b.start; });

    QByteArray out;
    out.reserve(xml.size() + 256);
    int cursor = 0;
    for (const auto& e : edits) {
        out.append(xml.constData() + cursor, e.start - cursor);
        out.append(e.text);
        cursor = e.end;
    }
    out.append(xml.constData() + cursor, xml.size() - cursor);

    if (replaced)
        *replaced = edits.size();
    return out;
}

// ═══════════════════════════════════════════════════════════════════════
//  Dry run / helpers
// ═══════════════════════════════════════════════════════════════════════

QStringList WriteBackEngine::validateWriteBack(const WriteBackOptions& options) const
{
    QStringList warnings;
    if (!QFileInfo(options.exportPath).isFile()) {
        warnings.append(QStringLiteral("export file not found: %1").arg(options.exportPath));
        return warnings;
    }

    SyncError parseErr;
    auto library = ExportParser::parseFile(options.exportPath, &parseErr);
    if (!library) {
        warnings.append(QStringLiteral("failed to parse export: %1").arg(parseErr.message));
        return warnings;
    }
    QSet<QString> exported;
    for (const auto& track : library->tracks)
        exported.insert(track.persistentId);

    for (const auto& update : options.updates) {
        if (update.persistentId.isEmpty()) {
            warnings.append(QStringLiteral("update for %1 has no persistent id").arg(update.newPath));
            continue;
        }
        if (!exported.contains(update.persistentId)) {
            warnings.append(QStringLiteral("persistent id not found in export: %1").arg(update.persistentId));
            continue;
        }
        auto path = pathForUpdate(update);
        if (!path) {
            warnings.append(QStringLiteral("unknown persistent id %1").arg(update.persistentId));
            continue;
        }
        if (!QFileInfo::exists(*path))
            warnings.append(QStringLiteral("new path does not exist: %1").arg(*path));
        else if (QFileInfo(*path).isDir())
            warnings.append(QStringLiteral("new path is a directory: %1").arg(*path));
    }
    return warnings;
}

QVector<WriteBackUpdate> WriteBackEngine::updatesForBooks(const QStringList& bookIds) const
{
    QVector<WriteBackUpdate> updates;
    for (const QString& id : bookIds) {
        auto book = m_store->bookById(id);
        if (!book)
            continue;

        const QVector<BookSegment> segments = m_store->segmentsForBook(book->id);
        if (segments.isEmpty()) {
            if (book->persistentId.isEmpty())
                continue;
            if (QFileInfo(book->filePath).isDir()) {
                qWarning() << "[WriteBack] Book" << book->title << "is a folder without tracks, skipped";
                continue;
            }
            updates.append({book->persistentId, book->filePath});
            continue;
        }
        for (const auto& seg : segments) {
            if (seg.persistentId.isEmpty()) {
                qDebug() << "[WriteBack] Segment" << seg.filePath << "has no persistent id";
                continue;
            }
            updates.append({seg.persistentId, seg.filePath});
        }
    }
    return updates;
}
