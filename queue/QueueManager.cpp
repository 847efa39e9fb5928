// Queue implementation: one worker thread per admitted job, all state
// changes serialized under mtx_ and published to the manager thread.
#include "QueueManager.hpp"
#include "ArtifactIntegrity.hpp"
#include "QueueStore.hpp"
#include "vrpkg/DeviceController.hpp"
#include "vrpkg/Extractor.hpp"
#include "vrpkg/RuntimeLogging.hpp"
#include "vrpkg/TransferExecutor.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QUrl>
#include <algorithm>
#include <chrono>
Q_LOGGING_CATEGORY(vrpkgQueue, "vrpkg.queue")

namespace vrpkg {

namespace {

qint64 steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

// Key as a single safe path component ("a/b" and ".." included).
QString encodedKey(const QString &key) {
    return QString::fromLatin1(
        QUrl::toPercentEncoding(key, QByteArray(), QByteArray(".")));
}

QString logLocator(const QString &locator) {
    return QString::fromStdString(locatorForLog(locator.toStdString()));
}

// install.txt (or Install.txt) at the top of the package, or empty.
QString installScriptIn(const QString &contentDir) {
    for (const char *name : {"install.txt", "Install.txt"}) {
        const QString path = QDir(contentDir).filePath(QLatin1String(name));
        if (QFileInfo(path).isFile())
            return path;
    }
    return QString();
}

void copyArtifacts(Job &dst, const Job &src) {
    dst.workDir = src.workDir;
    dst.archive = src.archive;
    dst.contentDir = src.contentDir;
    dst.contentReady = src.contentReady;
    dst.nextPhase = src.nextPhase;
}

} // namespace

void QueueManager::JobControl::enterPhase(JobPhase ph) {
    phase.store(int(ph));
    touch();
}

void QueueManager::JobControl::touch() { lastProgressMs.store(steadyNowMs()); }

QueueManager::QueueManager(const QueueCollaborators &collaborators,
                           const QueueManagerOptions &options, QObject *parent)
    : QObject(parent), c_(collaborators),
      progress_(std::chrono::milliseconds(qMax(0, options.progressIntervalMs))),
      maxConcurrent_(qMax(1, options.maxConcurrent)),
      downloadPath_(options.downloadPath) {
    qRegisterMetaType<vrpkg::QueueSnapshot>("vrpkg::QueueSnapshot");
    qRegisterMetaType<vrpkg::JobProgress>("vrpkg::JobProgress");
    limits_.download().setLimit(options.downloadLimitBytesPerSec);
    limits_.upload().setLimit(options.uploadLimitBytesPerSec);
    stallMs_[std::size_t(JobPhase::Download)] = qMax(0, options.downloadStallMs);
    stallMs_[std::size_t(JobPhase::Extract)] = qMax(0, options.extractStallMs);
    stallMs_[std::size_t(JobPhase::Install)] = qMax(0, options.installStallMs);
    stallMs_[std::size_t(JobPhase::Prepare)] = qMax(0, options.prepareStallMs);
    stallMs_[std::size_t(JobPhase::Upload)] = qMax(0, options.uploadStallMs);
    watchdog_.setInterval(qMax(10, options.watchdogIntervalMs));
    connect(&watchdog_, &QTimer::timeout, this, &QueueManager::checkStalls);
}

QueueManager::~QueueManager() { stop(); }

bool QueueManager::restore() {
    bool ok = true;
    QVector<Job> loaded;
    if (c_.store) {
        QString err;
        if (!c_.store->load(loaded, err)) {
            qCWarning(vrpkgQueue) << "Queue load failed; starting empty"
                                  << "error=" << err;
            loaded.clear();
            ok = false;
        }
    }
    // Jobs added before the restore follow the persisted ones.
    QVector<Job> pending;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        pending = queue_.jobs();
    }
    JobQueue restored;
    for (const Job &j : loaded) {
        if (restored.enqueue(j) != QueueError::None)
            qCWarning(vrpkgQueue) << "Skipping persisted job" << "key=" << j.key;
    }
    for (const Job &j : pending) {
        if (restored.enqueue(j) != QueueError::None)
            qCWarning(vrpkgQueue) << "Dropping job shadowed by persisted queue"
                                  << "key=" << j.key;
    }
    reconcileLoaded(restored);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        queue_.replaceAll(restored.jobs());
        publishLocked(true);
    }
    restored_ = true;
    qCInfo(vrpkgQueue) << "Queue restored" << "jobs=" << restored.size();
    return ok;
}

void QueueManager::start() {
    if (running_.load())
        return;
    if (!restored_)
        restore();
    running_.store(true);
    watchdog_.start();
    qCInfo(vrpkgQueue) << "Queue started"
                       << "maxConcurrent=" << maxConcurrent();
    schedule();
}

void QueueManager::reconcileLoaded(JobQueue &restored) {
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    QStringList vanished;
    for (int i = 0; i < restored.size(); ++i) {
        Job &j = restored.at(i);
        if (j.kind == JobKind::Download && j.status == JobStatus::Completed &&
            j.contentReady && !QFileInfo(j.contentDir).isDir()) {
            vanished << j.key;
            continue;
        }
        if (!isActiveStatus(j.status))
            continue;
        JobPhase phase = j.nextPhase;
        if (phase == JobPhase::Download || phase == JobPhase::Extract) {
            if (j.archive.complete &&
                verifyArtifact(j.archive, false) == ArtifactCheck::Valid) {
                phase = JobPhase::Extract;
            } else {
                if (!j.archive.path.isEmpty())
                    QFile::remove(j.archive.path);
                j.archive = ArtifactMarker{};
                phase = JobPhase::Download;
            }
            j.contentReady = false;
        } else if (phase == JobPhase::Prepare) {
            j.contentReady = false;
        }
        const JobStatus before = j.status;
        j.nextPhase = phase;
        restored.transition(j.key, failureStatusForPhase(phase), nowMs,
                            QStringLiteral("Interrupted by shutdown during %1")
                                .arg(QLatin1String(jobPhaseName(phase))));
        qCInfo(vrpkgQueue) << "Reconciled interrupted job"
                           << "key=" << j.key
                           << "was=" << jobStatusName(before)
                           << "retryPhase=" << jobPhaseName(phase);
    }
    for (const QString &key : vanished) {
        qCWarning(vrpkgQueue) << "Dropping completed job; content is gone"
                              << "key=" << key;
        restored.remove(key);
    }
}

void QueueManager::stop() {
    const bool wasRunning = running_.exchange(false);
    watchdog_.stop();
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = controls_.cbegin(); it != controls_.cend(); ++it)
            it.value()->requestStop(StopReason::Shutdown);
    }
    std::unordered_map<quint64, std::thread> workersToJoin;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        workersToJoin.swap(workers_);
        finishedWorkers_.clear();
    }
    for (auto &kv : workersToJoin) {
        if (kv.second.joinable())
            kv.second.join();
    }
    if (!wasRunning && !restored_)
        return;
    saveNow();
    // A later start() reloads and reconciles what was just saved.
    restored_ = false;
    qCInfo(vrpkgQueue) << "Queue stopped"
                       << "joinedWorkers=" << workersToJoin.size();
}

bool QueueManager::add(const QString &key, JobKind kind,
                       const JobPayload &payload) {
    if (key.trimmed().isEmpty() || payload.locator.trimmed().isEmpty() ||
        (kind == JobKind::Upload &&
         (payload.device.isEmpty() || payload.packageName.isEmpty()))) {
        qCCritical(vrpkgQueue) << "Rejected malformed job"
                               << "key=" << key
                               << "locator=" << logLocator(payload.locator);
        return false;
    }
    const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
    Job job;
    job.key = key;
    job.kind = kind;
    job.nextPhase =
        kind == JobKind::Upload ? JobPhase::Prepare : JobPhase::Download;
    job.payload = payload;
    job.createdAtMs = nowMs;
    job.updatedAtMs = nowMs;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const QueueError e = queue_.enqueue(job);
        if (e != QueueError::None) {
            qCWarning(vrpkgQueue) << "Add rejected" << "key=" << key
                                  << "reason=" << queueErrorName(e);
            return false;
        }
        publishLocked(true);
    }
    qCInfo(vrpkgQueue) << "Job added"
                       << "key=" << key
                       << "kind=" << (kind == JobKind::Upload ? "upload"
                                                              : "download")
                       << "locator=" << logLocator(payload.locator);
    schedule();
    return true;
}

void QueueManager::remove(const QString &key) {
    std::optional<Job> purgeNow;
    JobStatus prev = JobStatus::Queued;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const Job *j = queue_.find(key);
        if (!j) {
            qCDebug(vrpkgQueue) << "Remove ignored; unknown job" << "key=" << key;
            return;
        }
        prev = j->status;
        if (busyKeys_.contains(key)) {
            // The worker purges the files when it exits.
            const ControlPtr ctl = controls_.value(key);
            if (ctl) {
                ctl->requestStop(StopReason::User);
                ctl->removed.store(true);
            }
        } else {
            purgeNow = *j;
        }
        queue_.remove(key);
        publishLocked(true);
    }
    if (purgeNow)
        purgeJobFiles(*purgeNow, false);
    qCInfo(vrpkgQueue) << "Job removed"
                       << "key=" << key << "status=" << jobStatusName(prev);
    schedule();
}

bool QueueManager::deleteFiles(const QString &key) {
    std::optional<Job> idle;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const Job *j = queue_.find(key);
        if (!j) {
            qCWarning(vrpkgQueue) << "Delete files ignored; unknown job"
                                  << "key=" << key;
            return false;
        }
        if (busyKeys_.contains(key)) {
            const ControlPtr ctl = controls_.value(key);
            if (ctl) {
                ctl->purgeContent.store(true);
                ctl->requestStop(StopReason::User);
                ctl->removed.store(true);
            }
            queue_.remove(key);
            publishLocked(true);
        } else {
            idle = *j;
        }
    }
    if (idle) {
        // The job stays listed when its files cannot be deleted.
        if (!purgeJobFiles(*idle, true))
            return false;
        std::lock_guard<std::mutex> lk(mtx_);
        if (queue_.find(key) && !busyKeys_.contains(key)) {
            queue_.remove(key);
            publishLocked(true);
        }
    }
    qCInfo(vrpkgQueue) << "Job files deleted" << "key=" << key
                       << "dir=" << (idle ? idle->workDir : QString());
    schedule();
    return true;
}

void QueueManager::cancel(const QString &key) {
    JobStatus prev = JobStatus::Queued;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Job *j = queue_.find(key);
        if (!j || !isCancellableStatus(j->status)) {
            qCInfo(vrpkgQueue) << "Cancel ignored; job not queued or active"
                               << "key=" << key
                               << "status="
                               << (j ? jobStatusName(j->status) : "absent");
            return;
        }
        prev = j->status;
        const ControlPtr ctl = controls_.value(key);
        if (isActiveStatus(prev) && ctl) {
            j->nextPhase = ctl->currentPhase();
            ctl->requestStop(StopReason::User);
        }
        queue_.transition(key, JobStatus::Cancelled,
                          QDateTime::currentMSecsSinceEpoch());
        publishLocked(true);
    }
    qCInfo(vrpkgQueue) << "Job cancelled"
                       << "key=" << key << "from=" << jobStatusName(prev);
    schedule();
}

QueueError QueueManager::retry(const QString &key) {
    JobPhase phase = JobPhase::Download;
    int retries = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Job *j = queue_.find(key);
        if (!j)
            return QueueError::NotFound;
        if (!isRetryableStatus(j->status)) {
            qCInfo(vrpkgQueue) << "Retry rejected"
                               << "key=" << key
                               << "status=" << jobStatusName(j->status);
            return QueueError::NotRetryable;
        }
        if (j->kind == JobKind::Download) {
            // Resume from the failed phase only while its input survives;
            // the archive hash itself is checked by the worker.
            if (j->nextPhase == JobPhase::Install && j->contentReady &&
                QFileInfo(j->contentDir).isDir())
                phase = JobPhase::Install;
            else if (j->nextPhase != JobPhase::Download && j->archive.complete)
                phase = JobPhase::Extract;
            else
                phase = JobPhase::Download;
        } else {
            phase = (j->nextPhase == JobPhase::Upload && j->contentReady)
                        ? JobPhase::Upload
                        : JobPhase::Prepare;
        }
        j->nextPhase = phase;
        j->retryCount += 1;
        retries = j->retryCount;
        queue_.transition(key, JobStatus::Queued,
                          QDateTime::currentMSecsSinceEpoch());
        publishLocked(true);
    }
    qCInfo(vrpkgQueue) << "Job retried"
                       << "key=" << key << "phase=" << jobPhaseName(phase)
                       << "retryCount=" << retries;
    schedule();
    return QueueError::None;
}

QueueError QueueManager::install(const QString &key, const QString &device) {
    std::optional<Admission> direct;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        Job *j = queue_.find(key);
        if (!j)
            return QueueError::NotFound;
        if (j->kind != JobKind::Download ||
            (j->status != JobStatus::Completed &&
             j->status != JobStatus::Installed))
            return QueueError::NotInstallable;
        const QString target = device.trimmed();
        if (target.isEmpty() && j->payload.device.isEmpty())
            return QueueError::InvalidPayload;
        if (!target.isEmpty())
            j->payload.device = target;
        j->nextPhase = JobPhase::Install;
        const qint64 nowMs = QDateTime::currentMSecsSinceEpoch();
        const bool slotFree = running_.load() &&
                              queue_.activeCount() < maxConcurrent_ &&
                              queue_.nextAdmissible(maxConcurrent_, busyKeys_) < 0 &&
                              !busyKeys_.contains(key);
        if (slotFree) {
            direct = admitLocked(*j, JobStatus::Installing, nowMs);
        } else {
            queue_.transition(key, JobStatus::Queued, nowMs);
        }
        publishLocked(true);
    }
    qCInfo(vrpkgQueue) << "Install requested"
                       << "key=" << key << "device=" << device
                       << "queued=" << !direct.has_value();
    if (direct)
        launchWorker(*direct);
    else
        schedule();
    return QueueError::None;
}

int QueueManager::clearFinished() {
    QVector<Job> removed;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        removed = queue_.removeWhere([](const Job &j) {
            return j.status == JobStatus::Completed ||
                   j.status == JobStatus::Installed;
        });
        if (!removed.isEmpty())
            publishLocked(true);
    }
    qCInfo(vrpkgQueue) << "Cleared finished jobs" << "count=" << removed.size();
    return removed.size();
}

void QueueManager::setMaxConcurrent(int n) {
    n = qMax(1, n);
    int old = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        old = maxConcurrent_;
        maxConcurrent_ = n;
    }
    qCInfo(vrpkgQueue) << "maxConcurrent changed" << "from=" << old
                       << "to=" << n;
    if (n > old)
        schedule();
}

int QueueManager::maxConcurrent() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return maxConcurrent_;
}

void QueueManager::setDownloadPath(const QString &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    downloadPath_ = path;
}

QString QueueManager::downloadPath() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return downloadPath_;
}

void QueueManager::setStallTimeout(JobPhase phase, int ms) {
    std::lock_guard<std::mutex> lk(mtx_);
    stallMs_[std::size_t(phase)] = qMax(0, ms);
}

int QueueManager::stallTimeout(JobPhase phase) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stallMs_[std::size_t(phase)];
}

QueueSnapshot QueueManager::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    QueueSnapshot snap;
    snap.revision = revision_;
    snap.jobs = queue_.jobs();
    return snap;
}

std::optional<Job> QueueManager::job(const QString &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    const Job *j = queue_.find(key);
    if (!j)
        return std::nullopt;
    return *j;
}

Subscription QueueManager::onQueueUpdated(
    std::function<void(const QueueSnapshot &)> callback) {
    return Subscription(connect(
        this, &QueueManager::queueUpdated, this,
        [cb = std::move(callback)](const QueueSnapshot &s) { cb(s); }));
}

Subscription
QueueManager::onJobProgress(std::function<void(const JobProgress &)> callback) {
    return Subscription(connect(
        this, &QueueManager::jobProgress, this,
        [cb = std::move(callback)](const JobProgress &p) { cb(p); }));
}

void QueueManager::publishLocked(bool persist) {
    QueueSnapshot snap;
    snap.revision = ++revision_;
    snap.jobs = queue_.jobs();
    QMetaObject::invokeMethod(
        this, [this, snap, persist]() { deliverSnapshot(snap, persist); },
        Qt::QueuedConnection);
}

void QueueManager::deliverSnapshot(const QueueSnapshot &snap, bool persist) {
    // Older than what stop() already wrote.
    if (persist && c_.store && snap.revision > savedRevision_) {
        QString err;
        if (c_.store->save(snap.jobs, err))
            savedRevision_ = snap.revision;
        else
            qCWarning(vrpkgQueue) << "Queue save failed"
                                  << "revision=" << snap.revision
                                  << "error=" << err;
    }
    emit queueUpdated(snap);
}

void QueueManager::saveNow() {
    if (!c_.store)
        return;
    QVector<Job> jobs;
    quint64 revision = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        jobs = queue_.jobs();
        revision = revision_;
    }
    QString err;
    if (c_.store->save(jobs, err))
        savedRevision_ = revision;
    else
        qCWarning(vrpkgQueue) << "Queue save failed" << "error=" << err;
}

void QueueManager::schedule() {
    if (!running_.load())
        return;
    for (;;) {
        Admission a;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            const int idx = queue_.nextAdmissible(maxConcurrent_, busyKeys_);
            if (idx < 0)
                break;
            Job &j = queue_.at(idx);
            a = admitLocked(j, statusForPhase(j.nextPhase),
                            QDateTime::currentMSecsSinceEpoch());
            if (!a.ctl) {
                qCCritical(vrpkgQueue) << "Admission refused by state machine"
                                       << "key=" << j.key;
                break;
            }
            publishLocked(true);
        }
        launchWorker(a);
    }
}

QueueManager::Admission QueueManager::admitLocked(Job &j, JobStatus to,
                                                  qint64 nowMs) {
    Admission a;
    if (!queue_.transition(j.key, to, nowMs))
        return a;
    j.generation += 1;
    a.ctl = std::make_shared<JobControl>();
    a.ctl->generation = j.generation;
    a.ctl->enterPhase(j.nextPhase);
    controls_.insert(j.key, a.ctl);
    busyKeys_.insert(j.key);
    a.job = j;
    return a;
}

void QueueManager::launchWorker(const Admission &a) {
    progress_.begin(a.job.key.toStdString());
    qCInfo(vrpkgQueue) << "Admitting job"
                       << "key=" << a.job.key
                       << "phase=" << jobPhaseName(a.job.nextPhase)
                       << "retryCount=" << a.job.retryCount;
    std::lock_guard<std::mutex> wl(workersMutex_);
    const quint64 workerId = nextWorkerId_++;
    workers_[workerId] = std::thread([this, a, workerId]() {
        Job job = a.job;
        runWorker(job, a.ctl);
        finishWorker(workerId, job, a.ctl);
    });
}

void QueueManager::runWorker(Job &job, const ControlPtr &ctl) {
    JobPhase phase = job.nextPhase;
    PhaseResult r = PhaseResult::Ok;
    QString err;
    if (job.kind == JobKind::Download) {
        if (phase == JobPhase::Install) {
            r = runInstall(job, ctl, err);
            if (r == PhaseResult::Ok &&
                !commitTransition(job, ctl, JobStatus::Installed))
                r = PhaseResult::Stopped;
        } else {
            phase = JobPhase::Download;
            r = runFetch(job, ctl, err);
            if (r == PhaseResult::Ok) {
                phase = JobPhase::Extract;
                job.nextPhase = phase;
                ctl->enterPhase(phase);
                if (!commitTransition(job, ctl, JobStatus::Extracting))
                    r = PhaseResult::Stopped;
                else
                    r = runExtract(job, ctl, err);
            }
            if (r == PhaseResult::Ok) {
                job.nextPhase = JobPhase::Install;
                if (!commitTransition(job, ctl, JobStatus::Completed))
                    r = PhaseResult::Stopped;
            }
        }
    } else {
        phase = JobPhase::Prepare;
        r = runPrepare(job, ctl, err);
        if (r == PhaseResult::Ok) {
            phase = JobPhase::Upload;
            job.nextPhase = phase;
            ctl->enterPhase(phase);
            if (!commitTransition(job, ctl, JobStatus::Uploading))
                r = PhaseResult::Stopped;
            else
                r = runUpload(job, ctl, err);
        }
        if (r == PhaseResult::Ok &&
            !commitTransition(job, ctl, JobStatus::Completed))
            r = PhaseResult::Stopped;
    }
    concludePhase(job, ctl, phase, r, err);
}

QueueManager::PhaseResult
QueueManager::runFetch(Job &job, const ControlPtr &ctl, QString &err) {
    if (!c_.transfer) {
        err = QStringLiteral("No transfer executor configured");
        return PhaseResult::Failed;
    }
    const CancelCB cancel = [ctl]() { return ctl->stopRequested(); };
    if (job.archive.complete) {
        const ArtifactCheck check = verifyArtifact(job.archive, true, cancel);
        if (check == ArtifactCheck::Valid) {
            qCInfo(vrpkgQueue) << "Archive verified; skipping download"
                               << "key=" << job.key
                               << "bytes=" << job.archive.size;
            publishProgress(job.key, ctl,
                            progress_.complete(job.key.toStdString()),
                            job.archive.size, job.archive.size);
            return PhaseResult::Ok;
        }
        if (check == ArtifactCheck::Cancelled)
            return PhaseResult::Stopped;
        qCWarning(vrpkgQueue) << "Archive failed verification; downloading again"
                              << "key=" << job.key
                              << "check=" << artifactCheckName(check);
        QFile::remove(job.archive.path);
        job.archive = ArtifactMarker{};
    }
    // A retry admitted at Extract that falls back to downloading is watched
    // with the download stall window from here on.
    ctl->enterPhase(JobPhase::Download);

    if (job.workDir.isEmpty())
        job.workDir = workDirFor(job);
    if (job.workDir.isEmpty() || !QDir().mkpath(job.workDir)) {
        err = QStringLiteral("Cannot create work directory '%1'").arg(job.workDir);
        return PhaseResult::Failed;
    }
    const std::string base = locatorBaseName(job.payload.locator.toStdString());
    const QString fileName = base.empty()
                                 ? encodedKey(job.key) + QStringLiteral(".pkg")
                                 : QString::fromStdString(base);
    job.archive = ArtifactMarker{};
    job.archive.path = QDir(job.workDir).filePath(fileName);
    job.contentReady = false;
    if (!commitJob(job, ctl))
        return PhaseResult::Stopped;
    QFile::remove(job.archive.path);

    qCInfo(vrpkgQueue) << "Download started"
                       << "key=" << job.key
                       << "locator=" << logLocator(job.payload.locator);
    std::string e;
    const bool ok = c_.transfer->fetch(
        job.payload.locator.toStdString(), job.archive.path.toStdString(), e,
        progressReporter(job.key, ctl, &limits_.download()), cancel);
    if (ctl->stopRequested())
        return PhaseResult::Stopped;
    if (!ok) {
        err = QString::fromStdString(e);
        return PhaseResult::Failed;
    }

    ArtifactMarker marker;
    QString recordErr;
    if (!recordArtifact(job.archive.path, marker, recordErr, cancel)) {
        if (ctl->stopRequested())
            return PhaseResult::Stopped;
        err = recordErr;
        return PhaseResult::Failed;
    }
    if (job.payload.expectedSize > 0 && marker.size != job.payload.expectedSize) {
        err = QStringLiteral("Size mismatch: expected %1 bytes, got %2")
                  .arg(job.payload.expectedSize)
                  .arg(marker.size);
        return PhaseResult::Failed;
    }
    if (!job.payload.expectedSha256.isEmpty() &&
        marker.sha256.compare(job.payload.expectedSha256,
                              Qt::CaseInsensitive) != 0) {
        err = QStringLiteral("Checksum mismatch for %1").arg(fileName);
        return PhaseResult::Failed;
    }
    job.archive = marker;
    return PhaseResult::Ok;
}

QueueManager::PhaseResult
QueueManager::runExtract(Job &job, const ControlPtr &ctl, QString &err) {
    if (!c_.extractor) {
        err = QStringLiteral("No extractor configured");
        return PhaseResult::Failed;
    }
    progress_.begin(job.key.toStdString());
    job.contentDir = QDir(job.workDir).filePath(QStringLiteral("content"));
    job.contentReady = false;
    // Output of an interrupted extraction.
    QDir(job.contentDir).removeRecursively();

    std::string e;
    const bool ok = c_.extractor->extract(
        job.archive.path.toStdString(), job.contentDir.toStdString(), e,
        progressReporter(job.key, ctl, nullptr),
        [ctl]() { return ctl->stopRequested(); });
    if (ctl->stopRequested())
        return PhaseResult::Stopped;
    if (!ok) {
        err = QStringLiteral("Extraction failed: %1")
                  .arg(QString::fromStdString(e));
        return PhaseResult::Failed;
    }
    job.contentReady = true;
    return PhaseResult::Ok;
}

QueueManager::PhaseResult
QueueManager::runInstall(Job &job, const ControlPtr &ctl, QString &err) {
    if (!c_.devices) {
        err = QStringLiteral("No device controller configured");
        return PhaseResult::Failed;
    }
    if (!job.contentReady || !QFileInfo(job.contentDir).isDir()) {
        err = QStringLiteral("Package content missing; download it again");
        return PhaseResult::Failed;
    }
    if (job.payload.device.isEmpty()) {
        err = QStringLiteral("No target device");
        return PhaseResult::Failed;
    }
    const std::string device = job.payload.device.toStdString();
    const std::string packageName = job.payload.packageName.toStdString();
    const std::string contentDir = job.contentDir.toStdString();
    const CancelCB cancel = [ctl]() { return ctl->stopRequested(); };

    // A package shipping an install script is installed by it alone.
    const QString script = installScriptIn(job.contentDir);
    if (!script.isEmpty())
        qCInfo(vrpkgQueue) << "Running install script"
                           << "key=" << job.key << "script=" << script;
    auto installOnce = [&](std::string &e) {
        if (script.isEmpty())
            return c_.devices->install(device, contentDir, e);
        return c_.devices->runInstallScript(device, contentDir,
                                            script.toStdString(), e, cancel);
    };

    std::string e;
    bool ok = installOnce(e);
    if (!ok && !ctl->stopRequested() && !packageName.empty() &&
        c_.devices->isUpdateConflict(e)) {
        qCWarning(vrpkgQueue) << "Signature conflict; reinstalling"
                              << "key=" << job.key
                              << "package=" << job.payload.packageName;
        std::string ue;
        if (!c_.devices->uninstall(device, packageName, ue)) {
            err = QStringLiteral("Uninstall before reinstall failed: %1")
                      .arg(QString::fromStdString(ue));
            return PhaseResult::Failed;
        }
        e.clear();
        ok = installOnce(e);
    }
    if (ctl->stopRequested())
        return PhaseResult::Stopped;
    if (!ok) {
        err = script.isEmpty()
                  ? QString::fromStdString(e)
                  : QStringLiteral("Install script failed: %1")
                        .arg(QString::fromStdString(e));
        return PhaseResult::Failed;
    }
    ctl->touch();
    if (!script.isEmpty())
        return PhaseResult::Ok;

    // OBB data ships next to the APK in a directory named after the package.
    const QString obbDir =
        packageName.empty() ? QString()
                            : QDir(job.contentDir).filePath(job.payload.packageName);
    if (obbDir.isEmpty() || !QFileInfo(obbDir).isDir())
        return PhaseResult::Ok;
    if (!c_.transfer) {
        err = QStringLiteral("No transfer executor configured");
        return PhaseResult::Failed;
    }
    if (auto pct = progress_.report(job.key.toStdString(), 1, 2))
        publishProgress(job.key, ctl, *pct, 0, 0);
    e.clear();
    ok = c_.transfer->push(obbDir.toStdString(), device, e,
                           progressReporter(job.key, ctl, &limits_.upload(), true),
                           [ctl]() { return ctl->stopRequested(); });
    if (ctl->stopRequested())
        return PhaseResult::Stopped;
    if (!ok) {
        err = QStringLiteral("OBB push failed: %1").arg(QString::fromStdString(e));
        return PhaseResult::Failed;
    }
    return PhaseResult::Ok;
}

QueueManager::PhaseResult
QueueManager::runPrepare(Job &job, const ControlPtr &ctl, QString &err) {
    if (!c_.devices) {
        err = QStringLiteral("No device controller configured");
        return PhaseResult::Failed;
    }
    if (job.contentReady && QFileInfo(job.contentDir).isDir()) {
        qCInfo(vrpkgQueue) << "Staged package reused; skipping pull"
                           << "key=" << job.key;
        return PhaseResult::Ok;
    }
    if (job.workDir.isEmpty())
        job.workDir = workDirFor(job);
    if (job.workDir.isEmpty() || !QDir().mkpath(job.workDir)) {
        err = QStringLiteral("Cannot create work directory '%1'").arg(job.workDir);
        return PhaseResult::Failed;
    }
    job.contentDir = QDir(job.workDir).filePath(QStringLiteral("staging"));
    job.contentReady = false;
    QDir(job.contentDir).removeRecursively();
    if (!commitJob(job, ctl))
        return PhaseResult::Stopped;

    std::string e;
    const bool ok = c_.devices->pull(
        job.payload.device.toStdString(), job.payload.packageName.toStdString(),
        job.contentDir.toStdString(), e, progressReporter(job.key, ctl, nullptr),
        [ctl]() { return ctl->stopRequested(); });
    if (ctl->stopRequested())
        return PhaseResult::Stopped;
    if (!ok) {
        err = QStringLiteral("Pull from device failed: %1")
                  .arg(QString::fromStdString(e));
        return PhaseResult::Failed;
    }
    job.contentReady = true;
    return PhaseResult::Ok;
}

QueueManager::PhaseResult
QueueManager::runUpload(Job &job, const ControlPtr &ctl, QString &err) {
    if (!c_.transfer) {
        err = QStringLiteral("No transfer executor configured");
        return PhaseResult::Failed;
    }
    progress_.begin(job.key.toStdString());
    qCInfo(vrpkgQueue) << "Upload started"
                       << "key=" << job.key
                       << "locator=" << logLocator(job.payload.locator);
    std::string e;
    const bool ok = c_.transfer->upload(
        job.contentDir.toStdString(), job.payload.locator.toStdString(), e,
        progressReporter(job.key, ctl, &limits_.upload()),
        [ctl]() { return ctl->stopRequested(); });
    if (ctl->stopRequested())
        return PhaseResult::Stopped;
    if (!ok) {
        err = QString::fromStdString(e);
        return PhaseResult::Failed;
    }
    return PhaseResult::Ok;
}

void QueueManager::concludePhase(const Job &job, const ControlPtr &ctl,
                                 JobPhase phase, PhaseResult result,
                                 const QString &err) {
    if (result == PhaseResult::Ok) {
        qCInfo(vrpkgQueue) << "Job finished" << "key=" << job.key;
        return;
    }
    if (result == PhaseResult::Failed) {
        bool recorded = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            Job *j = queue_.find(job.key);
            if (isCurrentLocked(j, ctl)) {
                copyArtifacts(*j, job);
                j->nextPhase = phase;
                recorded = queue_.transition(job.key, failureStatusForPhase(phase),
                                             QDateTime::currentMSecsSinceEpoch(),
                                             err);
                if (recorded)
                    publishLocked(true);
            }
        }
        if (recorded) {
            qCWarning(vrpkgQueue) << "Job failed"
                                  << "key=" << job.key
                                  << "phase=" << jobPhaseName(phase)
                                  << "error=" << err;
            cleanupPhase(job, phase);
            return;
        }
    }
    // Stopped from outside; removal is purged by finishWorker.
    const StopReason reason = ctl->stopReason();
    qCInfo(vrpkgQueue) << "Worker stopped"
                       << "key=" << job.key
                       << "phase=" << jobPhaseName(phase)
                       << "reason=" << int(reason);
    if (ctl->removed.load())
        return;
    if (reason == StopReason::User || reason == StopReason::Stall)
        cleanupPhase(job, phase);
}

void QueueManager::finishWorker(quint64 workerId, const Job &job,
                                const ControlPtr &ctl) {
    // Files go before the key is released: a job re-added under the same key
    // reuses the work directory once it is admitted. removed only turns
    // true, so a removal racing the first pass costs one more pass.
    bool purged = false;
    for (;;) {
        const bool removed = ctl->removed.load();
        if (removed && !purged) {
            purgeJobFiles(job, ctl->purgeContent.load());
            purged = true;
        }
        std::lock_guard<std::mutex> lk(mtx_);
        if (ctl->removed.load() != removed)
            continue;
        busyKeys_.remove(job.key);
        auto it = controls_.find(job.key);
        if (it != controls_.end() && it.value() == ctl)
            controls_.erase(it);
        break;
    }
    progress_.forget(job.key.toStdString());
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        finishedWorkers_.push_back(workerId);
    }
    QMetaObject::invokeMethod(
        this,
        [this]() {
            reapWorkers();
            schedule();
        },
        Qt::QueuedConnection);
}

void QueueManager::reapWorkers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> wl(workersMutex_);
        for (quint64 id : finishedWorkers_) {
            auto it = workers_.find(id);
            if (it == workers_.end())
                continue;
            finished.push_back(std::move(it->second));
            workers_.erase(it);
        }
        finishedWorkers_.clear();
    }
    for (auto &t : finished) {
        if (t.joinable())
            t.join();
    }
}

void QueueManager::checkStalls() {
    const qint64 now = steadyNowMs();
    QStringList stalled;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        for (auto it = controls_.cbegin(); it != controls_.cend(); ++it) {
            const ControlPtr &ctl = it.value();
            const JobPhase phase = ctl->currentPhase();
            const int limitMs = stallMs_[std::size_t(phase)];
            if (limitMs <= 0 || now - ctl->lastProgressMs.load() < limitMs)
                continue;
            Job *j = queue_.find(it.key());
            if (!isCurrentLocked(j, ctl) || !isActiveStatus(j->status))
                continue;
            ctl->requestStop(StopReason::Stall);
            j->nextPhase = phase;
            queue_.transition(j->key, failureStatusForPhase(phase),
                              QDateTime::currentMSecsSinceEpoch(),
                              QStringLiteral("Stalled: no progress for %1 ms during %2")
                                  .arg(limitMs)
                                  .arg(QLatin1String(jobPhaseName(phase))));
            stalled << j->key;
        }
        if (!stalled.isEmpty())
            publishLocked(true);
    }
    for (const QString &key : stalled)
        qCWarning(vrpkgQueue) << "Job stalled; stopping worker" << "key=" << key;
    if (!stalled.isEmpty())
        schedule();
}

bool QueueManager::isCurrentLocked(const Job *j, const ControlPtr &ctl) const {
    return j && j->generation == ctl->generation && !ctl->stopRequested();
}

bool QueueManager::commitTransition(const Job &job, const ControlPtr &ctl,
                                    JobStatus to) {
    std::lock_guard<std::mutex> lk(mtx_);
    Job *j = queue_.find(job.key);
    if (!isCurrentLocked(j, ctl))
        return false;
    const JobStatus from = j->status;
    if (!queue_.transition(job.key, to, QDateTime::currentMSecsSinceEpoch())) {
        qCCritical(vrpkgQueue) << "Illegal transition"
                               << "key=" << job.key
                               << "from=" << jobStatusName(from)
                               << "to=" << jobStatusName(to);
        return false;
    }
    copyArtifacts(*j, job);
    publishLocked(true);
    return true;
}

bool QueueManager::commitJob(const Job &job, const ControlPtr &ctl) {
    std::lock_guard<std::mutex> lk(mtx_);
    Job *j = queue_.find(job.key);
    if (!isCurrentLocked(j, ctl))
        return false;
    copyArtifacts(*j, job);
    j->updatedAtMs = QDateTime::currentMSecsSinceEpoch();
    publishLocked(true);
    return true;
}

void QueueManager::publishProgress(const QString &key, const ControlPtr &ctl,
                                   int percent, quint64 done, quint64 total) {
    std::lock_guard<std::mutex> lk(mtx_);
    Job *j = queue_.find(key);
    if (!isCurrentLocked(j, ctl) || !isActiveStatus(j->status))
        return;
    j->progress = percent;
    j->bytesDone = done;
    j->bytesTotal = total;
    JobProgress p;
    p.key = key;
    p.status = j->status;
    p.percent = percent;
    p.bytesDone = done;
    p.bytesTotal = total;
    const int overall = progress_.overallPercent();
    QMetaObject::invokeMethod(
        this,
        [this, p, overall]() {
            emit jobProgress(p);
            emit overallProgress(overall);
        },
        Qt::QueuedConnection);
}

ProgressCB QueueManager::progressReporter(const QString &key,
                                          const ControlPtr &ctl,
                                          RateLimiter *limiter,
                                          bool secondHalf) {
    const std::string skey = key.toStdString();
    auto lastDone = std::make_shared<std::uint64_t>(0);
    return [this, key, skey, ctl, limiter, secondHalf,
            lastDone](std::uint64_t done, std::uint64_t total) {
        ctl->touch();
        if (limiter && done > *lastDone) {
            // Waiting for tokens is not a stall.
            const bool admitted = limiter->acquire(done - *lastDone, [ctl]() {
                ctl->touch();
                return ctl->stopRequested();
            });
            if (!admitted)
                return;
        }
        *lastDone = std::max(*lastDone, done);
        const std::optional<int> pct =
            secondHalf ? progress_.report(skey, total + done, 2 * total)
                       : progress_.report(skey, done, total);
        if (pct)
            publishProgress(key, ctl, *pct, done, total);
    };
}

QString QueueManager::workDirFor(const Job &job) const {
    QString base;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        base = downloadPath_;
    }
    if (base.isEmpty())
        return QString();
    QDir root(base);
    if (job.kind == JobKind::Upload)
        return root.filePath(QStringLiteral("uploads/") + encodedKey(job.key));
    return root.filePath(encodedKey(job.key));
}

void QueueManager::cleanupPhase(const Job &job, JobPhase phase) {
    switch (phase) {
    case JobPhase::Download:
        if (!job.archive.complete && !job.archive.path.isEmpty())
            QFile::remove(job.archive.path);
        break;
    case JobPhase::Extract:
    case JobPhase::Prepare:
        if (!job.contentReady && !job.contentDir.isEmpty())
            QDir(job.contentDir).removeRecursively();
        break;
    case JobPhase::Install:
    case JobPhase::Upload:
        break;
    }
}

bool QueueManager::purgeJobFiles(const Job &job, bool withContent) {
    // Without withContent an extracted download is a usable package; keep it.
    if (job.workDir.isEmpty() ||
        (!withContent && job.kind == JobKind::Download && job.contentReady))
        return true;
    if (!QFileInfo::exists(job.workDir))
        return true;
    if (!QDir(job.workDir).removeRecursively()) {
        qCWarning(vrpkgQueue) << "Cannot delete job files"
                              << "key=" << job.key << "dir=" << job.workDir;
        return false;
    }
    return true;
}

} // namespace vrpkg
