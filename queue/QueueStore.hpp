#pragma once
#include "Job.hpp"

namespace vrpkg {

// Durable storage for the queue. Used only by QueueManager.
class QueueStore {
public:
    virtual ~QueueStore() = default;
    virtual bool save(const QVector<Job> &jobs, QString &err) = 0;
    // A missing store is not an error: out is left empty.
    virtual bool load(QVector<Job> &out, QString &err) = 0;
};

} // namespace vrpkg
