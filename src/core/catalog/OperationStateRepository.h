#pragma once

#include <QByteArray>
#include <QString>
#include <optional>
#include "../export/LibraryFingerprint.h"

struct DatabaseContext;

// Small keyed tables the pipeline owns: operation params / checkpoints,
// export fingerprints and the do-not-import hash list.
class OperationStateRepository {
public:
    explicit OperationStateRepository(DatabaseContext* ctx);

    bool saveParams(const QString& operationId, const QByteArray& data);
    QByteArray params(const QString& operationId) const;
    bool saveState(const QString& operationId, const QByteArray& data);
    QByteArray state(const QString& operationId) const;
    bool deleteState(const QString& operationId);

    bool saveFingerprint(const LibraryFingerprint& fingerprint);
    std::optional<LibraryFingerprint> fingerprint(const QString& path) const;

    bool isHashBlocked(const QString& hash) const;
    bool blockHash(const QString& hash, const QString& reason);

private:
    bool upsertBlob(const QString& table, const QString& operationId, const QByteArray& data);
    QByteArray blob(const QString& table, const QString& operationId) const;

    DatabaseContext* m_ctx;
};
