// Package queue: admits jobs up to maxConcurrent, runs each on its own worker
// thread, persists the queue and fans out snapshots and progress.
#pragma once
#include "Job.hpp"
#include "JobQueue.hpp"
#include "Subscription.hpp"
#include "vrpkg/ProgressAggregator.hpp"
#include "vrpkg/RateLimiter.hpp"

#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QTimer>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace vrpkg {

class TransferExecutor;
class Extractor;
class DeviceController;
class QueueStore;

// Collaborators are not owned and must outlive the manager. They are called
// from worker threads, concurrently for different jobs.
struct QueueCollaborators {
    TransferExecutor *transfer = nullptr;
    Extractor *extractor = nullptr;
    DeviceController *devices = nullptr;
    QueueStore *store = nullptr; // optional
};

struct QueueManagerOptions {
    int maxConcurrent = 1;
    QString downloadPath;
    quint64 downloadLimitBytesPerSec = 0; // 0 = unlimited
    quint64 uploadLimitBytesPerSec = 0;
    int progressIntervalMs = 100;
    int watchdogIntervalMs = 250;
    // Stall window per phase (ms); 0 disables the watchdog for that phase.
    int downloadStallMs = 60000;
    int extractStallMs = 300000;
    int installStallMs = 0;
    int prepareStallMs = 300000;
    int uploadStallMs = 60000;
};

class QueueManager : public QObject {
    Q_OBJECT
public:
    QueueManager(const QueueCollaborators &collaborators,
                 const QueueManagerOptions &options,
                 QObject *parent = nullptr);
    ~QueueManager() override;

    // Loads the persisted queue and reconciles jobs interrupted by the
    // previous shutdown, without admitting anything. False when the store
    // could not be read (the queue then starts empty).
    bool restore();
    // restore() when not done yet, then starts admitting.
    void start();
    // Stops workers cooperatively, joins them and saves the queue. Jobs still
    // active are saved as such and reconciled by the next start().
    void stop();
    bool isRunning() const { return running_.load(); }

    // False on duplicate key or malformed payload.
    bool add(const QString &key, JobKind kind, const JobPayload &payload);
    // Cancels when active, deletes partial artifacts; absent key is a no-op.
    // The extracted content of a finished download is kept.
    void remove(const QString &key);
    // Deletes every file of the job, extracted content included, and removes
    // it. False for an unknown key or when the files could not be deleted
    // (the job is then kept).
    bool deleteFiles(const QString &key);
    // Logged no-op when the job is not queued or active.
    void cancel(const QString &key);
    QueueError retry(const QString &key);
    // Install a completed download on device.
    QueueError install(const QString &key, const QString &device);
    // Drops Completed and Installed jobs; returns how many.
    int clearFinished();

    void setMaxConcurrent(int n);
    int maxConcurrent() const;
    // Applies to jobs that start downloading after the call.
    void setDownloadPath(const QString &path);
    QString downloadPath() const;
    void setDownloadLimit(quint64 bytesPerSec) {
        limits_.download().setLimit(bytesPerSec);
    }
    void setUploadLimit(quint64 bytesPerSec) {
        limits_.upload().setLimit(bytesPerSec);
    }
    quint64 downloadLimit() const { return limits_.download().limit(); }
    quint64 uploadLimit() const { return limits_.upload().limit(); }
    void setStallTimeout(JobPhase phase, int ms);
    int stallTimeout(JobPhase phase) const;

    QueueSnapshot snapshot() const;
    std::optional<Job> job(const QString &key) const;

    Subscription
    onQueueUpdated(std::function<void(const QueueSnapshot &)> callback);
    Subscription onJobProgress(std::function<void(const JobProgress &)> callback);

signals:
    // Full ordered queue after every mutation.
    void queueUpdated(const vrpkg::QueueSnapshot &snapshot);
    // Debounced per-job progress.
    void jobProgress(const vrpkg::JobProgress &progress);
    void overallProgress(int percent);

public slots:
    void schedule(); // admits queued jobs while slots are free

private:
    enum class StopReason { None = 0, User, Stall, Shutdown };
    enum class PhaseResult { Ok, Failed, Stopped };

    // Per-admission control block shared with the worker.
    struct JobControl {
        quint64 generation = 0;
        std::atomic<int> reason{0};
        std::atomic<bool> removed{false};
        std::atomic<bool> purgeContent{false};
        std::atomic<int> phase{0};
        std::atomic<qint64> lastProgressMs{0};

        bool stopRequested() const { return reason.load() != 0; }
        void requestStop(StopReason r) {
            int expected = 0;
            reason.compare_exchange_strong(expected, int(r));
        }
        StopReason stopReason() const { return StopReason(reason.load()); }
        JobPhase currentPhase() const { return JobPhase(phase.load()); }
        void enterPhase(JobPhase ph);
        void touch();
    };
    using ControlPtr = std::shared_ptr<JobControl>;

    struct Admission {
        Job job;
        ControlPtr ctl;
    };
    Admission admitLocked(Job &j, JobStatus to, qint64 nowMs);
    void launchWorker(const Admission &a);

    void runWorker(Job &job, const ControlPtr &ctl);
    PhaseResult runFetch(Job &job, const ControlPtr &ctl, QString &err);
    PhaseResult runExtract(Job &job, const ControlPtr &ctl, QString &err);
    PhaseResult runInstall(Job &job, const ControlPtr &ctl, QString &err);
    PhaseResult runPrepare(Job &job, const ControlPtr &ctl, QString &err);
    PhaseResult runUpload(Job &job, const ControlPtr &ctl, QString &err);
    void concludePhase(const Job &job, const ControlPtr &ctl, JobPhase phase,
                       PhaseResult result, const QString &err);
    void finishWorker(quint64 workerId, const Job &job, const ControlPtr &ctl);
    void reapWorkers();
    void checkStalls();

    // Worker-side state updates; false when the admission went stale
    // (cancelled, removed, timed out) and the worker must stop.
    bool commitTransition(const Job &job, const ControlPtr &ctl, JobStatus to);
    bool commitJob(const Job &job, const ControlPtr &ctl);
    void publishProgress(const QString &key, const ControlPtr &ctl,
                         int percent, quint64 done, quint64 total);
    // secondHalf maps the call onto 50..100 % of the phase.
    ProgressCB progressReporter(const QString &key, const ControlPtr &ctl,
                                RateLimiter *limiter, bool secondHalf = false);

    bool isCurrentLocked(const Job *j, const ControlPtr &ctl) const;
    void publishLocked(bool persist);
    void deliverSnapshot(const QueueSnapshot &snap, bool persist);
    void saveNow();

    QString workDirFor(const Job &job) const;
    static void cleanupPhase(const Job &job, JobPhase phase);
    static bool purgeJobFiles(const Job &job, bool withContent);
    static void reconcileLoaded(JobQueue &restored);

    QueueCollaborators c_;
    BandwidthLimits limits_;
    ProgressAggregator progress_;

    mutable std::mutex mtx_; // protects everything below up to workersMutex_
    JobQueue queue_;
    QHash<QString, ControlPtr> controls_;
    QSet<QString> busyKeys_; // keys whose worker has not exited yet
    int maxConcurrent_ = 1;
    QString downloadPath_;
    std::array<int, 5> stallMs_{};
    quint64 revision_ = 0;
    quint64 savedRevision_ = 0; // manager thread only

    std::mutex workersMutex_; // protects workers_ and finishedWorkers_
    std::unordered_map<quint64, std::thread> workers_;
    std::vector<quint64> finishedWorkers_;
    quint64 nextWorkerId_ = 1;

    std::atomic<bool> running_{false};
    bool restored_ = false;
    QTimer watchdog_;
};

} // namespace vrpkg
