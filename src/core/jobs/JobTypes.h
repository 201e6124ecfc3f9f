#pragma once

#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QVector>
#include <optional>

#include "../SyncError.h"
#include "../export/ExportTypes.h"

// ── Phases ──────────────────────────────────────────────────────────
// importing → enriching → organizing → completed. Optional phases may be
// skipped forward; canceled / failed are reachable from any running phase.
enum class JobPhase {
    Importing,
    Enriching,
    Organizing,
    Completed,
    Canceled,
    Failed
};

QString jobPhaseName(JobPhase phase);
std::optional<JobPhase> jobPhaseFromName(const QString& name);
bool isTerminalPhase(JobPhase phase);
bool canTransition(JobPhase from, JobPhase to);

// ── Import mode ─────────────────────────────────────────────────────
enum class ImportMode {
    Organized,   // files already live in the organized tree
    Import,      // catalog only, files stay where they are
    Organize     // catalog, then move into the organized tree
};

QString importModeName(ImportMode mode);
ImportMode importModeFromName(const QString& name);   // unknown → Import

// ── Job parameters ──────────────────────────────────────────────────
// Written once at job start, reloaded on resume.
struct JobParams {
    QString exportPath;
    ImportMode importMode = ImportMode::Import;
    QVector<PathMapping> pathMappings;
    bool skipDuplicates = true;
    bool enrichMetadata = false;
    bool autoOrganize = false;
    bool preserveLocation = false;
    bool importPlaylists = false;

    bool shouldOrganize() const
    {
        return (autoOrganize || importMode == ImportMode::Organize) && !preserveLocation;
    }

    QByteArray toJson() const;
    static std::optional<JobParams> fromJson(const QByteArray& data, SyncError* error = nullptr);
};

// ── Checkpoint ──────────────────────────────────────────────────────
// Last confirmed safe-to-resume position inside a phase.
struct Checkpoint {
    JobPhase  phase = JobPhase::Importing;
    int       index = 0;
    int       total = 0;
    QDateTime updatedAt;

    QByteArray toJson(const QString& jobId) const;
    static std::optional<Checkpoint> fromJson(const QByteArray& data, SyncError* error = nullptr);
};
