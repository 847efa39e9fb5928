#include "Job.hpp"

namespace vrpkg {

const char *jobStatusName(JobStatus st) {
    switch (st) {
    case JobStatus::Queued:
        return "Queued";
    case JobStatus::Downloading:
        return "Downloading";
    case JobStatus::Extracting:
        return "Extracting";
    case JobStatus::Completed:
        return "Completed";
    case JobStatus::Installing:
        return "Installing";
    case JobStatus::Installed:
        return "Installed";
    case JobStatus::Preparing:
        return "Preparing";
    case JobStatus::Uploading:
        return "Uploading";
    case JobStatus::Error:
        return "Error";
    case JobStatus::Cancelled:
        return "Cancelled";
    case JobStatus::InstallError:
        return "InstallError";
    }
    return "Unknown";
}

std::optional<JobStatus> jobStatusFromName(const QString &name) {
    static const JobStatus all[] = {
        JobStatus::Queued,    JobStatus::Downloading, JobStatus::Extracting,
        JobStatus::Completed, JobStatus::Installing,  JobStatus::Installed,
        JobStatus::Preparing, JobStatus::Uploading,   JobStatus::Error,
        JobStatus::Cancelled, JobStatus::InstallError};
    for (JobStatus st : all) {
        if (name == QLatin1String(jobStatusName(st)))
            return st;
    }
    return std::nullopt;
}

const char *jobPhaseName(JobPhase ph) {
    switch (ph) {
    case JobPhase::Download:
        return "Download";
    case JobPhase::Extract:
        return "Extract";
    case JobPhase::Install:
        return "Install";
    case JobPhase::Prepare:
        return "Prepare";
    case JobPhase::Upload:
        return "Upload";
    }
    return "Unknown";
}

std::optional<JobPhase> jobPhaseFromName(const QString &name) {
    static const JobPhase all[] = {JobPhase::Download, JobPhase::Extract,
                                   JobPhase::Install, JobPhase::Prepare,
                                   JobPhase::Upload};
    for (JobPhase ph : all) {
        if (name == QLatin1String(jobPhaseName(ph)))
            return ph;
    }
    return std::nullopt;
}

const char *queueErrorName(QueueError e) {
    switch (e) {
    case QueueError::None:
        return "None";
    case QueueError::DuplicateKey:
        return "DuplicateKey";
    case QueueError::NotFound:
        return "NotFound";
    case QueueError::NotRetryable:
        return "NotRetryable";
    case QueueError::NotInstallable:
        return "NotInstallable";
    case QueueError::InvalidPayload:
        return "InvalidPayload";
    }
    return "Unknown";
}

bool isActiveStatus(JobStatus st) {
    return st == JobStatus::Downloading || st == JobStatus::Extracting ||
           st == JobStatus::Installing || st == JobStatus::Preparing ||
           st == JobStatus::Uploading;
}

bool isTerminalStatus(JobStatus st) {
    return st == JobStatus::Completed || st == JobStatus::Installed ||
           st == JobStatus::Error || st == JobStatus::Cancelled ||
           st == JobStatus::InstallError;
}

bool isRetryableStatus(JobStatus st) {
    return st == JobStatus::Error || st == JobStatus::Cancelled ||
           st == JobStatus::InstallError;
}

bool isCancellableStatus(JobStatus st) {
    return st == JobStatus::Queued || isActiveStatus(st);
}

JobStatus statusForPhase(JobPhase ph) {
    switch (ph) {
    case JobPhase::Download:
    case JobPhase::Extract:
        // Extraction retries pass through Downloading, where the archive is
        // verified and the fetch skipped when it is intact.
        return JobStatus::Downloading;
    case JobPhase::Install:
        return JobStatus::Installing;
    case JobPhase::Prepare:
    case JobPhase::Upload:
        return JobStatus::Preparing;
    }
    return JobStatus::Downloading;
}

JobStatus failureStatusForPhase(JobPhase ph) {
    return ph == JobPhase::Install ? JobStatus::InstallError : JobStatus::Error;
}

bool canTransition(JobStatus from, JobStatus to) {
    if (from == to)
        return false;
    switch (from) {
    case JobStatus::Queued:
        return to == JobStatus::Downloading || to == JobStatus::Installing ||
               to == JobStatus::Preparing || to == JobStatus::Cancelled;
    case JobStatus::Downloading:
        return to == JobStatus::Extracting || to == JobStatus::Error ||
               to == JobStatus::Cancelled;
    case JobStatus::Extracting:
        return to == JobStatus::Completed || to == JobStatus::Error ||
               to == JobStatus::Cancelled;
    case JobStatus::Completed:
    case JobStatus::Installed:
        // User (re)install: straight in when a slot is free, else queued.
        return to == JobStatus::Installing || to == JobStatus::Queued;
    case JobStatus::Installing:
        return to == JobStatus::Installed || to == JobStatus::InstallError ||
               to == JobStatus::Cancelled;
    case JobStatus::Preparing:
        return to == JobStatus::Uploading || to == JobStatus::Error ||
               to == JobStatus::Cancelled;
    case JobStatus::Uploading:
        return to == JobStatus::Completed || to == JobStatus::Error ||
               to == JobStatus::Cancelled;
    case JobStatus::Error:
    case JobStatus::Cancelled:
    case JobStatus::InstallError:
        return to == JobStatus::Queued;
    }
    return false;
}

} // namespace vrpkg
