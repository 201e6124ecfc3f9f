#pragma once

#include <QString>

// Tunables read from SyncSettings when a job or engine is constructed.
struct PipelineOptions {
    int progressBatch = 10;      // report progress every N units
    int checkpointBatch = 10;    // persist a checkpoint every N groups
    int errorLimit = 50;         // ImportStatus keeps at most N error strings

    // Enrichment throttling: fixed sleeps, no adaptive rate limiting
    int failureRunLimit = 5;
    int failureBackoffMs = 30000;
    int successBatch = 25;
    int successPauseMs = 2000;
};

struct OrganizerOptions {
    QString rootDir;
    QString pattern = QStringLiteral("%author%/%title%");
};
