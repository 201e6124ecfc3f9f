#pragma once

#include <QString>

// Error taxonomy shared by the import/sync/write-back pipeline.
// Functions that can fail take an optional SyncError* out-parameter
// (same idiom as QJsonParseError) and return bool / std::optional.
struct SyncError {
    enum class Kind {
        None,
        Parse,       // malformed export, fatal to the job
        Decode,      // one track's location unusable, group skipped
        IO,          // missing/unreadable file, group skipped
        Conflict,    // write-back fingerprint mismatch, nothing written
        Validation,  // write-back input or output invalid, rolled back
        NotFound,    // job id / persistent id unknown
        Store        // catalog store rejected a read or write
    };

    Kind kind = Kind::None;
    QString message;

    bool isError() const { return kind != Kind::None; }
    QString kindName() const;

    static SyncError make(Kind kind, const QString& message) { return SyncError{kind, message}; }
};

inline QString SyncError::kindName() const
{
    switch (kind) {
    case Kind::None:       return QStringLiteral("none");
    case Kind::Parse:      return QStringLiteral("parse");
    case Kind::Decode:     return QStringLiteral("decode");
    case Kind::IO:         return QStringLiteral("io");
    case Kind::Conflict:   return QStringLiteral("conflict");
    case Kind::Validation: return QStringLiteral("validation");
    case Kind::NotFound:   return QStringLiteral("not_found");
    case Kind::Store:      return QStringLiteral("store");
    }
    return QStringLiteral("unknown");
}

// Fill an optional out-parameter.
inline void setError(SyncError* error, SyncError::Kind kind, const QString& message)
{
    if (error) {
        error->kind = kind;
        error->message = message;
    }
}
