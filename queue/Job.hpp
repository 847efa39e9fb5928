// Job model for the package queue: one item's path through download ->
// extract -> install (or prepare -> upload) with its state and options.
#pragma once
#include <QMetaType>
#include <QString>
#include <QVector>
#include <optional>

namespace vrpkg {

enum class JobKind { Download, Upload };

// Status of a job:
//  - Queued: waiting for a concurrency slot
//  - Downloading / Extracting / Installing / Preparing / Uploading: active
//  - Completed: downloaded+extracted, or uploaded
//  - Installed: pushed to the device
//  - Error / InstallError: failed, message in Job::error
//  - Cancelled: stopped by the user
enum class JobStatus {
    Queued,
    Downloading,
    Extracting,
    Completed,
    Installing,
    Installed,
    Preparing,
    Uploading,
    Error,
    Cancelled,
    InstallError
};

// Pipeline stage. A queued job enters nextPhase on admission; after a failure
// nextPhase records the stage that failed.
enum class JobPhase { Download, Extract, Install, Prepare, Upload };

enum class QueueError {
    None,
    DuplicateKey,
    NotFound,
    NotRetryable,
    NotInstallable,
    InvalidPayload
};

// Explicit integrity record of a phase output, written when the phase
// completes and checked before it is reused.
struct ArtifactMarker {
    QString path;
    quint64 size = 0;
    QString sha256; // hex
    bool complete = false;
};

struct JobPayload {
    QString locator;     // catalog source (download) or destination (upload)
    QString device;      // target (install) or source (upload) device serial
    QString packageName; // installed package id
    quint64 expectedSize = 0; // 0 = unknown
    QString expectedSha256;   // empty = unknown
};

struct Job {
    QString key; // stable identifier, e.g. release name
    JobKind kind = JobKind::Download;
    JobStatus status = JobStatus::Queued;
    JobPhase nextPhase = JobPhase::Download;
    int progress = 0; // 0..100, only meaningful while active
    quint64 bytesDone = 0;
    quint64 bytesTotal = 0;
    QString error;
    int retryCount = 0;
    qint64 createdAtMs = 0;
    qint64 updatedAtMs = 0;
    JobPayload payload;
    QString workDir;    // per-job directory, fixed when the job first starts
    ArtifactMarker archive; // downloaded archive
    QString contentDir; // extraction output or upload staging directory
    bool contentReady = false; // contentDir fully written by its phase
    quint64 generation = 0;    // bumped on every admission
};

// Coherent copy of the whole queue at one point in time.
struct QueueSnapshot {
    quint64 revision = 0;
    QVector<Job> jobs;
};

struct JobProgress {
    QString key;
    JobStatus status = JobStatus::Queued;
    int percent = 0;
    quint64 bytesDone = 0;
    quint64 bytesTotal = 0;
};

const char *jobStatusName(JobStatus st);
std::optional<JobStatus> jobStatusFromName(const QString &name);
const char *jobPhaseName(JobPhase ph);
std::optional<JobPhase> jobPhaseFromName(const QString &name);
const char *queueErrorName(QueueError e);

bool isActiveStatus(JobStatus st);
bool isTerminalStatus(JobStatus st);
bool isRetryableStatus(JobStatus st);
// Can a user cancel a job in this status?
bool isCancellableStatus(JobStatus st);

// Status a job takes when it is admitted into phase.
JobStatus statusForPhase(JobPhase ph);
// Status a job takes when phase fails.
JobStatus failureStatusForPhase(JobPhase ph);

// The transition table; every status change goes through it.
bool canTransition(JobStatus from, JobStatus to);

} // namespace vrpkg

Q_DECLARE_METATYPE(vrpkg::QueueSnapshot)
Q_DECLARE_METATYPE(vrpkg::JobProgress)
