#include "JobQueue.hpp"

namespace vrpkg {

QueueError JobQueue::enqueue(const Job &job) {
    if (job.key.isEmpty())
        return QueueError::InvalidPayload;
    if (contains(job.key))
        return QueueError::DuplicateKey;
    jobs_.push_back(job);
    return QueueError::None;
}

int JobQueue::indexOf(const QString &key) const {
    for (int i = 0; i < jobs_.size(); ++i)
        if (jobs_[i].key == key)
            return i;
    return -1;
}

Job *JobQueue::find(const QString &key) {
    const int i = indexOf(key);
    return i >= 0 ? &jobs_[i] : nullptr;
}

const Job *JobQueue::find(const QString &key) const {
    const int i = indexOf(key);
    return i >= 0 ? &jobs_[i] : nullptr;
}

bool JobQueue::remove(const QString &key) {
    const int i = indexOf(key);
    if (i < 0)
        return false;
    jobs_.removeAt(i);
    return true;
}

QVector<Job>
JobQueue::removeWhere(const std::function<bool(const Job &)> &pred) {
    QVector<Job> removed;
    QVector<Job> next;
    next.reserve(jobs_.size());
    for (const auto &j : jobs_) {
        if (pred(j))
            removed.push_back(j);
        else
            next.push_back(j);
    }
    jobs_.swap(next);
    return removed;
}

bool JobQueue::transition(const QString &key, JobStatus to, qint64 nowMs,
                          const QString &error) {
    Job *j = find(key);
    if (!j || !canTransition(j->status, to))
        return false;
    j->status = to;
    j->updatedAtMs = nowMs;
    if (isActiveStatus(to)) {
        j->progress = 0;
        j->bytesDone = 0;
        j->bytesTotal = 0;
    } else if (to == JobStatus::Queued) {
        j->progress = 0;
    } else if (to == JobStatus::Completed || to == JobStatus::Installed) {
        j->progress = 100;
    }
    if (to == JobStatus::Error || to == JobStatus::InstallError)
        j->error = error.isEmpty() ? QStringLiteral("Unknown error") : error;
    else
        j->error.clear();
    return true;
}

int JobQueue::activeCount() const {
    int n = 0;
    for (const auto &j : jobs_)
        if (isActiveStatus(j.status))
            ++n;
    return n;
}

int JobQueue::nextAdmissible(int maxConcurrent,
                             const QSet<QString> &busy) const {
    if (activeCount() >= maxConcurrent)
        return -1;
    for (int i = 0; i < jobs_.size(); ++i) {
        if (jobs_[i].status == JobStatus::Queued && !busy.contains(jobs_[i].key))
            return i;
    }
    return -1;
}

} // namespace vrpkg
