// Ordered job collection plus the admission rule. Not thread-safe: the owner
// (QueueManager) serializes every call under its queue mutex.
#pragma once
#include "Job.hpp"

#include <QSet>
#include <functional>

namespace vrpkg {

class JobQueue {
public:
    // DuplicateKey when the key exists in any status; InvalidPayload when
    // the key is empty.
    QueueError enqueue(const Job &job);

    Job *find(const QString &key);
    const Job *find(const QString &key) const;
    int indexOf(const QString &key) const;
    bool contains(const QString &key) const { return indexOf(key) >= 0; }

    bool remove(const QString &key);
    // Returns the removed jobs.
    QVector<Job> removeWhere(const std::function<bool(const Job &)> &pred);

    // Validated status change. Entering an active status resets progress;
    // error is kept only for Error/InstallError.
    bool transition(const QString &key, JobStatus to, qint64 nowMs,
                    const QString &error = QString());

    int activeCount() const;
    // Oldest queued job that may start now, skipping keys in busy (their
    // previous worker is still unwinding). -1 when none or no slot is free.
    int nextAdmissible(int maxConcurrent, const QSet<QString> &busy) const;

    const QVector<Job> &jobs() const { return jobs_; }
    Job &at(int i) { return jobs_[i]; }
    int size() const { return jobs_.size(); }
    void replaceAll(const QVector<Job> &jobs) { jobs_ = jobs; }

private:
    QVector<Job> jobs_;
};

} // namespace vrpkg
